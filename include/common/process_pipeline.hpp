#pragma once

#include "common/cancellation_token.hpp"
#include "common/subprocess.hpp"
#include <chrono>
#include <functional>
#include <string>

// Two processes joined by one pipe: the producer's stdout feeds the
// consumer's stdin. The consumer starts first so it is ready to read, and
// both exit statuses are reported separately.
class ProcessPipeline {
public:
    struct Result {
        int producerExit{-1};
        int consumerExit{-1};
        std::string producerStderr;
        std::string consumerStderr;
        bool cancelled{false};
        std::chrono::milliseconds elapsed{0};

        bool succeeded() const { return !cancelled && producerExit == 0 && consumerExit == 0; }
        // Names every side that failed, with the tail of its stderr.
        std::string describeFailure(const std::string& producerName, const std::string& consumerName) const;
    };

    using TickCallback = std::function<void(std::chrono::milliseconds elapsed)>;

    ProcessPipeline(CommandSpec producer, CommandSpec consumer);

    void setProducerStderrCallback(Subprocess::LineCallback callback) { producerStderr_ = std::move(callback); }
    void setConsumerStderrCallback(Subprocess::LineCallback callback) { consumerStderr_ = std::move(callback); }
    void setTickCallback(std::chrono::milliseconds interval, TickCallback callback);

    // Throws SyncError (TRANSFER) when either process cannot be started.
    // Cancellation terminates both process groups.
    Result run(const CancellationToken* token);

private:
    CommandSpec producer_;
    CommandSpec consumer_;
    Subprocess::LineCallback producerStderr_;
    Subprocess::LineCallback consumerStderr_;
    std::chrono::milliseconds tickInterval_{2000};
    TickCallback tick_;
};
