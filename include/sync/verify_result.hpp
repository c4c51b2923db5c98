#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Outcome of comparing a source with its target. A result is valid exactly
// when no mismatch has been recorded.
class VerifyResult {
public:
    bool isValid() const { return mismatches_.empty(); }
    bool isComplete() const { return sourceCount_ == targetCount_; }

    void setCounts(int64_t sourceCount, int64_t targetCount);
    void addCounts(int64_t sourceCount, int64_t targetCount);
    int64_t getSourceCount() const { return sourceCount_; }
    int64_t getTargetCount() const { return targetCount_; }

    void addMismatch(const std::string& description);
    const std::vector<std::string>& getMismatches() const { return mismatches_; }

    void setChecksums(const std::string& sourceChecksum, const std::string& targetChecksum);
    const std::string& getSourceChecksum() const { return sourceChecksum_; }
    const std::string& getTargetChecksum() const { return targetChecksum_; }

    void setDetail(const std::string& key, const nlohmann::json& value);
    const nlohmann::json& getDetails() const { return details_; }

    std::string toString() const;
    nlohmann::json toJson() const;

private:
    int64_t sourceCount_{0};
    int64_t targetCount_{0};
    std::vector<std::string> mismatches_;
    std::string sourceChecksum_;
    std::string targetChecksum_;
    nlohmann::json details_ = nlohmann::json::object();
};
