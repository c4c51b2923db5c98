#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace utils {

// Percent-encodes a string for use inside a URL component.
std::string urlEncode(const std::string& str);

std::string trim(const std::string& str);
std::string toLower(const std::string& str);
bool startsWith(const std::string& str, const std::string& prefix);
bool endsWith(const std::string& str, const std::string& suffix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Replaces every character outside [A-Za-z0-9_] with '_'.
std::string sanitizeName(const std::string& name);

// Hex millisecond timestamp followed by 8 random hex digits.
std::string generateId();

// Lowercase hex SHA-256 of a file's content. Throws std::runtime_error.
std::string sha256File(const std::string& path);
std::string sha256Hex(const std::string& data);

// Copy of a command line with the values following credential flags
// (and key=value pairs naming secrets) replaced by "[REDACTED]".
std::vector<std::string> redactArguments(const std::vector<std::string>& args);

// "KEY=value" strings for the current process environment overlaid with
// `overrides`.
std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides);

} // namespace utils
