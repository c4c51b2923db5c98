#pragma once

#include <stdexcept>
#include <string>

// Failure raised by strategy operations. The category tells the engine and
// callers whether the problem was in the request, the network, the data
// transfer itself, or a cancellation.
class SyncError : public std::runtime_error {
public:
    enum class Category {
        CONFIGURATION,
        CONNECTIVITY,
        TRANSFER,
        PROTOCOL,
        CANCELLED
    };

    SyncError(Category category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    Category getCategory() const { return category_; }
    bool isCancellation() const { return category_ == Category::CANCELLED; }

    static std::string categoryToString(Category category) {
        switch (category) {
            case Category::CONFIGURATION: return "configuration";
            case Category::CONNECTIVITY:  return "connectivity";
            case Category::TRANSFER:      return "transfer";
            case Category::PROTOCOL:      return "protocol";
            case Category::CANCELLED:     return "cancelled";
            default:                      return "unknown";
        }
    }

private:
    Category category_;
};
