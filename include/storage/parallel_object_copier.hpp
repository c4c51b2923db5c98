#pragma once

#include "storage/object_transport.hpp"
#include <atomic>
#include <chrono>

// Fans a listed set of objects out over a fixed pool of workers sharing one
// bounded work queue. Each failed copy is logged and counted as an error on
// the reporter; it never stops the other workers.
class ParallelObjectCopier {
public:
    struct Result {
        int64_t objectsCopied{0};
        int64_t objectsFailed{0};
        int64_t bytesCopied{0};
        bool cancelled{false};
        std::vector<std::string> failedKeys;
    };

    ParallelObjectCopier(ObjectTransport& transport, int workers);

    void setReportInterval(std::chrono::milliseconds interval) { reportInterval_ = interval; }
    int getWorkerCount() const { return workers_; }

    Result run(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
               const std::vector<ObjectInfo>& objects, ProgressReporter& reporter);

private:
    ObjectTransport& transport_;
    int workers_;
    std::chrono::milliseconds reportInterval_{1000};
};
