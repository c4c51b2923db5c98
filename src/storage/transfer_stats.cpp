#include "storage/transfer_stats.hpp"
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <regex>

namespace {

// Numbers out of range yield nothing instead of throwing; these run on
// subprocess reader threads.
std::optional<int64_t> parseCount(const std::string& text) {
    int64_t value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parsePercent(const std::string& text) {
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

} // namespace

TransferStats parseRcloneStatsLine(const std::string& line) {
    static const std::regex bytesPattern(R"(Transferred:\s+([0-9.]+)\s*(\w+)\s*/\s*([0-9.]+)\s*(\w+),\s*([0-9]+)%)");
    static const std::regex countPattern(R"(Transferred:\s+(\d+)\s*/\s*(\d+),\s*(\d+)%)");

    TransferStats stats;
    std::smatch match;
    if (std::regex_search(line, match, countPattern)) {
        stats.itemsDone = parseCount(match[1].str());
        stats.itemsTotal = parseCount(match[2].str());
        stats.percent = parsePercent(match[3].str());
    } else if (std::regex_search(line, match, bytesPattern)) {
        stats.percent = parsePercent(match[5].str());
    }
    stats.isError = line.find("ERROR") != std::string::npos;
    return stats;
}

TransferStats parseMcLine(const std::string& line) {
    TransferStats stats;
    auto open = line.find('`');
    if (open != std::string::npos) {
        auto close = line.find('`', open + 1);
        if (close != std::string::npos && close > open + 1) {
            stats.currentItem = line.substr(open + 1, close - open - 1);
        }
    }
    static const std::regex percentPattern(R"((\d+(?:\.\d+)?)%)");
    std::smatch match;
    if (std::regex_search(line, match, percentPattern)) {
        stats.percent = parsePercent(match[1].str());
    }
    stats.isError = line.find("mc: <ERROR>") != std::string::npos || line.find("ERROR") == 0;
    return stats;
}
