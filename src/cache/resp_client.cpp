#include "cache/resp_client.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "sync/sync_error.hpp"
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace {

timeval toTimeval(std::chrono::milliseconds ms) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

SyncError connectivityError(const std::string& message) {
    return SyncError(SyncError::Category::CONNECTIVITY, message);
}

} // namespace

RespClient::RespClient(Options options)
    : options_(std::move(options)) {
}

RespClient::~RespClient() {
    close();
}

RespClient::Options RespClient::optionsFromEndpoint(const Endpoint& endpoint) {
    Options options;
    options.host = endpoint.host.empty() ? "localhost" : endpoint.host;
    options.port = endpoint.port > 0 ? endpoint.port : 6379;
    options.username = endpoint.credentials.username;
    options.password = endpoint.credentials.password;
    options.tls = endpoint.ssl;

    std::string mode = utils::toLower(endpoint.sslMode);
    options.tlsVerify = !(mode == "require" || mode == "insecure" || mode == "skip-verify");
    options.caFile = endpoint.getOption("ca_file");

    try {
        if (!endpoint.database.empty()) {
            options.database = std::stoi(endpoint.database);
        }
        std::string readTimeout = endpoint.getOption("read_timeout_ms");
        if (!readTimeout.empty()) {
            options.readTimeout = std::chrono::milliseconds(std::stoll(readTimeout));
        }
        std::string connectTimeout = endpoint.getOption("connect_timeout_ms");
        if (!connectTimeout.empty()) {
            options.connectTimeout = std::chrono::milliseconds(std::stoll(connectTimeout));
        }
    } catch (const std::exception&) {
        throw SyncError(SyncError::Category::CONFIGURATION,
                        "invalid cache endpoint setting for " + endpoint.describe() +
                        " (database and timeouts must be numeric)");
    }
    return options;
}

void RespClient::connect() {
    if (isConnected()) {
        return;
    }

    dial();
    try {
        if (options_.tls) {
            startTls();
        }
        authenticate();
    } catch (...) {
        close();
        throw;
    }
    Logger::debug("Connected to cache at " + options_.host + ":" + std::to_string(options_.port) +
                  (options_.tls ? " (TLS)" : ""));
}

void RespClient::dial() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    std::string port = std::to_string(options_.port);
    int rc = ::getaddrinfo(options_.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        throw connectivityError("failed to resolve " + options_.host + ": " + gai_strerror(rc));
    }

    std::string lastError = "no addresses";
    for (addrinfo* addr = results; addr != nullptr; addr = addr->ai_next) {
        int fd = ::socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
        if (fd < 0) {
            lastError = strerror(errno);
            continue;
        }

        // On Linux the send timeout also bounds connect().
        timeval connectTimeout = toTimeval(options_.connectTimeout);
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &connectTimeout, sizeof(connectTimeout));

        if (::connect(fd, addr->ai_addr, addr->ai_addrlen) == 0) {
            int noDelay = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
            if (options_.readTimeout.count() > 0) {
                timeval readTimeout = toTimeval(options_.readTimeout);
                ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &readTimeout, sizeof(readTimeout));
            }
            fd_ = fd;
            break;
        }
        lastError = strerror(errno);
        ::close(fd);
    }
    ::freeaddrinfo(results);

    if (fd_ < 0) {
        throw connectivityError("failed to connect to " + options_.host + ":" + port + ": " + lastError);
    }
}

std::string RespClient::tlsError(const std::string& what) const {
    char buffer[256];
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return what + ": " + buffer;
}

void RespClient::startTls() {
    sslContext_ = SSL_CTX_new(TLS_client_method());
    if (!sslContext_) {
        throw connectivityError(tlsError("failed to create TLS context"));
    }

    if (options_.tlsVerify) {
        SSL_CTX_set_verify(sslContext_, SSL_VERIFY_PEER, nullptr);
        int loaded = options_.caFile.empty()
            ? SSL_CTX_set_default_verify_paths(sslContext_)
            : SSL_CTX_load_verify_locations(sslContext_, options_.caFile.c_str(), nullptr);
        if (loaded != 1) {
            throw connectivityError(tlsError("failed to load CA certificates"));
        }
    } else {
        SSL_CTX_set_verify(sslContext_, SSL_VERIFY_NONE, nullptr);
    }

    ssl_ = SSL_new(sslContext_);
    if (!ssl_) {
        throw connectivityError(tlsError("failed to create TLS session"));
    }
    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, options_.host.c_str());
    if (options_.tlsVerify) {
        SSL_set1_host(ssl_, options_.host.c_str());
    }

    if (SSL_connect(ssl_) != 1) {
        throw connectivityError(tlsError("TLS handshake with " + options_.host + " failed"));
    }
}

void RespClient::authenticate() {
    if (!options_.password.empty()) {
        std::vector<std::string> auth = {"AUTH"};
        if (!options_.username.empty()) {
            auth.push_back(options_.username);
        }
        auth.push_back(options_.password);

        RespValue reply = command(auth);
        if (reply.isError()) {
            throw connectivityError("authentication to " + options_.host + " failed: " + reply.str);
        }
    }

    if (options_.database != 0) {
        RespValue reply = command({"SELECT", std::to_string(options_.database)});
        if (reply.isError()) {
            throw connectivityError("failed to select database " + std::to_string(options_.database) +
                                    ": " + reply.str);
        }
    }
}

void RespClient::close() {
    if (ssl_) {
        SSL_shutdown(ssl_);
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (sslContext_) {
        SSL_CTX_free(sslContext_);
        sslContext_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    parser_ = RespParser();
}

void RespClient::sendAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n;
        if (ssl_) {
            n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
            if (n <= 0) {
                throw connectivityError(tlsError("TLS write to " + options_.host + " failed"));
            }
        } else {
            n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw connectivityError("write to " + options_.host + " failed: " + strerror(errno));
            }
        }
        sent += static_cast<size_t>(n);
    }
}

void RespClient::readMore() {
    char buffer[16 * 1024];
    while (true) {
        ssize_t n;
        if (ssl_) {
            n = SSL_read(ssl_, buffer, sizeof(buffer));
            if (n <= 0) {
                throw connectivityError(tlsError("TLS read from " + options_.host + " failed"));
            }
        } else {
            n = ::recv(fd_, buffer, sizeof(buffer), 0);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    throw connectivityError("read from " + options_.host + " timed out");
                }
                throw connectivityError("read from " + options_.host + " failed: " + strerror(errno));
            }
            if (n == 0) {
                throw connectivityError("connection closed by " + options_.host);
            }
        }
        parser_.append(buffer, static_cast<size_t>(n));
        return;
    }
}

RespValue RespClient::readReply() {
    while (true) {
        auto reply = parser_.next();
        if (reply) {
            return *reply;
        }
        readMore();
    }
}

RespValue RespClient::command(const std::vector<std::string>& args) {
    if (!isConnected()) {
        throw connectivityError("not connected to " + options_.host);
    }
    sendAll(resp::encodeCommand(args));
    return readReply();
}

RespValue RespClient::execute(const std::vector<std::string>& args) {
    RespValue reply = command(args);
    if (reply.isError()) {
        std::string name = args.empty() ? "" : args.front();
        throw SyncError(SyncError::Category::PROTOCOL, name + " failed: " + reply.str);
    }
    return reply;
}
