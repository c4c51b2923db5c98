#include "common/process_pipeline.hpp"
#include "common/logger.hpp"
#include "sync/sync_error.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <thread>
#include <unistd.h>

namespace {

std::string stderrTail(const std::string& text) {
    const size_t limit = 512;
    std::string tail = text.size() > limit ? "..." + text.substr(text.size() - limit) : text;
    while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) {
        tail.pop_back();
    }
    return tail;
}

} // namespace

std::string ProcessPipeline::Result::describeFailure(const std::string& producerName,
                                                     const std::string& consumerName) const {
    if (cancelled) {
        return producerName + " | " + consumerName + " cancelled";
    }

    std::string message;
    if (producerExit != 0) {
        message = producerName + " exited with status " + std::to_string(producerExit);
        if (!producerStderr.empty()) {
            message += ": " + stderrTail(producerStderr);
        }
    }
    if (consumerExit != 0) {
        if (!message.empty()) {
            message += "; ";
        }
        message += consumerName + " exited with status " + std::to_string(consumerExit);
        if (!consumerStderr.empty()) {
            message += ": " + stderrTail(consumerStderr);
        }
    }
    return message;
}

ProcessPipeline::ProcessPipeline(CommandSpec producer, CommandSpec consumer)
    : producer_(std::move(producer))
    , consumer_(std::move(consumer)) {
}

void ProcessPipeline::setTickCallback(std::chrono::milliseconds interval, TickCallback callback) {
    tickInterval_ = interval;
    tick_ = std::move(callback);
}

ProcessPipeline::Result ProcessPipeline::run(const CancellationToken* token) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw SyncError(SyncError::Category::TRANSFER,
                        std::string("failed to create pipe: ") + strerror(errno));
    }

    Subprocess consumer(consumer_);
    consumer.redirectStdin(fds[0]);
    consumer.captureStderr(consumerStderr_);
    if (!consumer.start()) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw SyncError(SyncError::Category::TRANSFER, consumer.getLastError());
    }

    Subprocess producer(producer_);
    producer.redirectStdout(fds[1]);
    producer.captureStderr(producerStderr_);
    if (!producer.start()) {
        ::close(fds[0]);
        ::close(fds[1]);
        consumer.terminate();
        consumer.wait();
        throw SyncError(SyncError::Category::TRANSFER, producer.getLastError());
    }

    // Only the children may hold the pipe, or the consumer never sees EOF.
    ::close(fds[0]);
    ::close(fds[1]);

    Result result;
    auto started = std::chrono::steady_clock::now();
    auto lastTick = started;

    while (!(producer.tryWait() && consumer.tryWait())) {
        if (token && token->isCancelled()) {
            Logger::warning("Cancelling pipeline " + producer_.program + " | " + consumer_.program);
            result.cancelled = true;
            producer.terminate();
            consumer.terminate();
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (tick_ && now - lastTick >= tickInterval_) {
            lastTick = now;
            tick_(std::chrono::duration_cast<std::chrono::milliseconds>(now - started));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    result.producerExit = producer.wait();
    result.consumerExit = consumer.wait();
    result.producerStderr = producer.getStderr();
    result.consumerStderr = consumer.getStderr();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}
