#pragma once

#include "cache/resp.hpp"
#include "sync/sync_types.hpp"
#include <chrono>
#include <string>
#include <vector>

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

// Blocking RESP connection over TCP, optionally wrapped in TLS. AUTH and
// SELECT are issued right after the connection is established.
class RespClient {
public:
    struct Options {
        std::string host{"localhost"};
        int port{6379};
        std::string username;
        std::string password;
        int database{0};
        bool tls{false};
        bool tlsVerify{true};
        std::string caFile;
        std::chrono::milliseconds connectTimeout{10000};
        // Zero leaves reads blocking until the peer answers.
        std::chrono::milliseconds readTimeout{0};
    };

    explicit RespClient(Options options);
    ~RespClient();

    RespClient(const RespClient&) = delete;
    RespClient& operator=(const RespClient&) = delete;

    // Throws SyncError (CONNECTIVITY) on dial, handshake or auth failure.
    void connect();
    void close();
    bool isConnected() const { return fd_ >= 0; }

    // Sends one command and returns its reply; error replies are returned
    // as values. Throws SyncError on I/O failure.
    RespValue command(const std::vector<std::string>& args);

    // Like command(), but throws SyncError (PROTOCOL) on an error reply.
    RespValue execute(const std::vector<std::string>& args);

    const Options& getOptions() const { return options_; }

    // Throws SyncError (CONFIGURATION) for a non-numeric database.
    static Options optionsFromEndpoint(const Endpoint& endpoint);

private:
    void dial();
    void startTls();
    void authenticate();
    void sendAll(const std::string& data);
    void readMore();
    RespValue readReply();
    std::string tlsError(const std::string& what) const;

    Options options_;
    int fd_{-1};
    SSL_CTX* sslContext_{nullptr};
    SSL* ssl_{nullptr};
    RespParser parser_;
};
