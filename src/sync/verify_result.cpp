#include "sync/verify_result.hpp"
#include <sstream>

void VerifyResult::setCounts(int64_t sourceCount, int64_t targetCount) {
    sourceCount_ = sourceCount;
    targetCount_ = targetCount;
}

void VerifyResult::addCounts(int64_t sourceCount, int64_t targetCount) {
    sourceCount_ += sourceCount;
    targetCount_ += targetCount;
}

void VerifyResult::addMismatch(const std::string& description) {
    mismatches_.push_back(description);
}

void VerifyResult::setChecksums(const std::string& sourceChecksum, const std::string& targetChecksum) {
    sourceChecksum_ = sourceChecksum;
    targetChecksum_ = targetChecksum;
}

void VerifyResult::setDetail(const std::string& key, const nlohmann::json& value) {
    details_[key] = value;
}

std::string VerifyResult::toString() const {
    std::stringstream ss;
    if (isValid()) {
        ss << "Verification passed: " << sourceCount_ << " source, " << targetCount_ << " target";
    } else {
        ss << "Verification failed: " << mismatches_.size() << " mismatches ("
           << sourceCount_ << " source, " << targetCount_ << " target)";
        size_t shown = 0;
        for (const auto& mismatch : mismatches_) {
            if (shown++ == 5) {
                ss << "; ...";
                break;
            }
            ss << "; " << mismatch;
        }
    }
    return ss.str();
}

nlohmann::json VerifyResult::toJson() const {
    nlohmann::json j;
    j["valid"] = isValid();
    j["complete"] = isComplete();
    j["source_count"] = sourceCount_;
    j["target_count"] = targetCount_;
    j["mismatches"] = mismatches_;
    j["source_checksum"] = sourceChecksum_;
    j["target_checksum"] = targetChecksum_;
    j["details"] = details_;
    return j;
}
