#include "common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <curl/curl.h>
#include <openssl/evp.h>

extern char** environ;

namespace utils {

std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize curl handle for URL encoding");
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    if (!encoded) {
        curl_easy_cleanup(curl);
        throw std::runtime_error("Failed to URL-encode value");
    }
    std::string result(encoded);
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    auto begin = str.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(whitespace);
    return str.substr(begin, end - begin + 1);
}

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(str);
    while (std::getline(stream, current, delimiter)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string sanitizeName(const std::string& name) {
    std::string result = name;
    for (auto& c : result) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            c = '_';
        }
    }
    return result;
}

std::string generateId() {
    auto now = std::chrono::system_clock::now();
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << nowMs.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }
    return ss.str();
}

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext newSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create OpenSSL digest context");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
    return ctx;
}

std::string finalizeHex(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace

std::string sha256File(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for checksum: " + path);
    }

    auto ctx = newSha256Context();
    char buffer[64 * 1024];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            throw std::runtime_error("Failed to update SHA-256 digest for " + path);
        }
    }
    return finalizeHex(ctx.get());
}

std::string sha256Hex(const std::string& data) {
    auto ctx = newSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }
    return finalizeHex(ctx.get());
}

std::vector<std::string> redactArguments(const std::vector<std::string>& args) {
    static const std::vector<std::string> secretFlags = {"-a", "--pass", "--password"};
    static const std::vector<std::string> secretKeys = {"secret_access_key", "key", "sas_url",
                                                        "password", "pass", "token"};

    std::vector<std::string> result;
    result.reserve(args.size());
    bool redactNext = false;
    for (const auto& arg : args) {
        if (redactNext) {
            result.push_back("[REDACTED]");
            redactNext = false;
            continue;
        }
        // rclone config takes "key value" pairs as separate arguments
        if (std::find(secretFlags.begin(), secretFlags.end(), arg) != secretFlags.end() ||
            std::find(secretKeys.begin(), secretKeys.end(), arg) != secretKeys.end()) {
            result.push_back(arg);
            redactNext = true;
            continue;
        }
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            std::string key = toLower(arg.substr(0, eq));
            while (startsWith(key, "-")) {
                key.erase(0, 1);
            }
            if (std::find(secretKeys.begin(), secretKeys.end(), key) != secretKeys.end()) {
                result.push_back(arg.substr(0, eq + 1) + "[REDACTED]");
                continue;
            }
        }
        result.push_back(arg);
    }
    return result;
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        std::string key = eq == std::string::npos ? item : item.substr(0, eq);
        if (overrides.find(key) == overrides.end()) {
            env.push_back(item);
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

} // namespace utils
