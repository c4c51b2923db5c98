#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

struct SyncEvent {
    enum class Type {
        TASK_START,
        TASK_PROGRESS,
        TASK_COMPLETE,
        TASK_ERROR,
        PLAN_COMPLETE
    };

    Type type{Type::TASK_PROGRESS};
    std::string planId;
    std::string taskId;
    std::string taskName;
    std::string taskType;
    std::string status;
    int progress{0};
    int64_t bytesTotal{0};
    int64_t bytesDone{0};
    int64_t itemsTotal{0};
    int64_t itemsDone{0};
    std::string error;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static std::string typeToString(Type type);
    nlohmann::json toJson() const;
};

using EventCallback = std::function<void(const SyncEvent& event)>;
