#include "storage/parallel_object_copier.hpp"
#include "common/bounded_queue.hpp"
#include "common/logger.hpp"
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>

ParallelObjectCopier::ParallelObjectCopier(ObjectTransport& transport, int workers)
    : transport_(transport)
    , workers_(workers > 0 ? workers : 1) {
}

ParallelObjectCopier::Result ParallelObjectCopier::run(const SyncContext& ctx, const Endpoint& source,
                                                       const Endpoint& target, const std::vector<ObjectInfo>& objects,
                                                       ProgressReporter& reporter) {
    BoundedQueue<ObjectInfo> queue(static_cast<size_t>(workers_) * 10);
    std::atomic<int64_t> bytesDone{0};
    std::atomic<int64_t> itemsDone{0};
    std::atomic<int64_t> failures{0};
    const int64_t total = static_cast<int64_t>(objects.size());
    std::mutex failedMutex;
    std::vector<std::string> failedKeys;

    auto recordFailure = [&](const std::string& key, const std::string& reason) {
        failures.fetch_add(1);
        Logger::warning("Copy of " + key + " failed: " + reason);
        reporter.error("copy of " + key + " failed: " + reason);
        std::lock_guard<std::mutex> lock(failedMutex);
        failedKeys.push_back(key);
    };

    auto worker = [&]() {
        while (!ctx.isCancelled()) {
            auto object = queue.popFor(std::chrono::milliseconds(100));
            if (!object) {
                if (queue.isClosed() && queue.size() == 0) {
                    break;
                }
                continue;
            }
            try {
                transport_.copyObject(ctx, source, target, object->key);
                bytesDone.fetch_add(object->size);
                itemsDone.fetch_add(1);
            } catch (const SyncError& e) {
                if (e.isCancellation()) {
                    break;
                }
                recordFailure(object->key, e.what());
            } catch (const std::exception& e) {
                recordFailure(object->key, e.what());
            }
        }
    };

    std::mutex doneMutex;
    std::condition_variable doneCv;
    bool finished = false;
    std::thread progressThread([&]() {
        std::unique_lock<std::mutex> lock(doneMutex);
        while (!finished) {
            doneCv.wait_for(lock, reportInterval_);
            int64_t items = itemsDone.load();
            reporter.update(bytesDone.load(), items,
                            std::to_string(items) + "/" + std::to_string(total) + " objects");
        }
    });

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(workers_));
    for (int i = 0; i < workers_; ++i) {
        pool.emplace_back(worker);
    }

    for (const auto& object : objects) {
        bool queued = false;
        while (!queued && !ctx.isCancelled()) {
            queued = queue.pushFor(object, std::chrono::milliseconds(100));
        }
        if (ctx.isCancelled()) {
            break;
        }
    }
    queue.close();

    for (auto& thread : pool) {
        thread.join();
    }
    {
        std::lock_guard<std::mutex> lock(doneMutex);
        finished = true;
    }
    doneCv.notify_all();
    progressThread.join();

    Result result;
    result.objectsCopied = itemsDone.load();
    result.objectsFailed = failures.load();
    result.bytesCopied = bytesDone.load();
    result.cancelled = ctx.isCancelled();
    result.failedKeys = std::move(failedKeys);
    reporter.update(result.bytesCopied, result.objectsCopied,
                    std::to_string(result.objectsCopied) + "/" + std::to_string(total) + " objects");
    return result;
}
