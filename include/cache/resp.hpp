#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// A decoded RESP reply.
struct RespValue {
    enum class Type {
        SIMPLE_STRING,
        ERROR,
        INTEGER,
        BULK_STRING,
        ARRAY,
        NIL
    };

    Type type{Type::NIL};
    std::string str;
    int64_t integer{0};
    std::vector<RespValue> elements;

    static RespValue simple(const std::string& value);
    static RespValue error(const std::string& message);
    static RespValue fromInteger(int64_t value);
    static RespValue bulk(const std::string& value);
    static RespValue array(std::vector<RespValue> values);
    static RespValue nil();

    bool isNil() const { return type == Type::NIL; }
    bool isError() const { return type == Type::ERROR; }
    bool isArray() const { return type == Type::ARRAY; }
    bool isInteger() const { return type == Type::INTEGER; }

    // Text of string-like replies; integers are formatted, nil is empty.
    std::string asString() const;
};

namespace resp {

// *N\r\n followed by one $len\r\narg\r\n per argument.
std::string encodeCommand(const std::vector<std::string>& args);
std::string encode(const RespValue& value);

} // namespace resp

// Incremental decoder. Bytes are appended as they arrive from the socket;
// next() yields a reply only once all of its bytes are buffered.
class RespParser {
public:
    void append(const char* data, size_t length);
    void append(const std::string& data) { append(data.data(), data.size()); }

    // Throws SyncError(PROTOCOL) on malformed input.
    std::optional<RespValue> next();

    size_t buffered() const { return buffer_.size() - offset_; }

private:
    bool parseValue(size_t& pos, RespValue& out) const;
    bool readLine(size_t& pos, std::string& line) const;
    int64_t parseNumber(const std::string& text) const;
    void compact();

    std::string buffer_;
    size_t offset_{0};
};
