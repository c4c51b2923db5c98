#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Minimal catalog access used for size estimation, target database
// creation and row-count verification. Data itself never flows through it.
class SqlConnection {
public:
    virtual ~SqlConnection() = default;

    // First column of every result row, NULL as empty string.
    virtual std::vector<std::string> queryColumn(const std::string& sql) = 0;
    virtual void execute(const std::string& sql) = 0;

    virtual std::string quoteIdentifier(const std::string& identifier) const = 0;
    virtual std::string quoteLiteral(const std::string& value) const = 0;

    // First value of the first row as an integer; 0 for an empty result.
    int64_t queryInt(const std::string& sql);
};
