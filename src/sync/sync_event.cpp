#include "sync/sync_event.hpp"

std::string SyncEvent::typeToString(Type type) {
    switch (type) {
        case Type::TASK_START:    return "task_start";
        case Type::TASK_PROGRESS: return "task_progress";
        case Type::TASK_COMPLETE: return "task_complete";
        case Type::TASK_ERROR:    return "task_error";
        case Type::PLAN_COMPLETE: return "plan_complete";
        default:                  return "unknown";
    }
}

nlohmann::json SyncEvent::toJson() const {
    nlohmann::json j;
    j["type"] = typeToString(type);
    j["plan_id"] = planId;
    if (!taskId.empty()) {
        j["task_id"] = taskId;
        j["task_name"] = taskName;
        j["task_type"] = taskType;
    }
    j["status"] = status;
    j["progress"] = progress;
    j["bytes_total"] = bytesTotal;
    j["bytes_done"] = bytesDone;
    j["items_total"] = itemsTotal;
    j["items_done"] = itemsDone;
    if (!error.empty()) {
        j["error"] = error;
    }
    if (!message.empty()) {
        j["message"] = message;
    }
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count();
    return j;
}
