#include "cache/resp.hpp"
#include "sync/sync_error.hpp"
#include <algorithm>
#include <stdexcept>

RespValue RespValue::simple(const std::string& value) {
    RespValue v;
    v.type = Type::SIMPLE_STRING;
    v.str = value;
    return v;
}

RespValue RespValue::error(const std::string& message) {
    RespValue v;
    v.type = Type::ERROR;
    v.str = message;
    return v;
}

RespValue RespValue::fromInteger(int64_t value) {
    RespValue v;
    v.type = Type::INTEGER;
    v.integer = value;
    return v;
}

RespValue RespValue::bulk(const std::string& value) {
    RespValue v;
    v.type = Type::BULK_STRING;
    v.str = value;
    return v;
}

RespValue RespValue::array(std::vector<RespValue> values) {
    RespValue v;
    v.type = Type::ARRAY;
    v.elements = std::move(values);
    return v;
}

RespValue RespValue::nil() {
    return RespValue();
}

std::string RespValue::asString() const {
    switch (type) {
        case Type::SIMPLE_STRING:
        case Type::ERROR:
        case Type::BULK_STRING:
            return str;
        case Type::INTEGER:
            return std::to_string(integer);
        default:
            return "";
    }
}

namespace resp {

std::string encodeCommand(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

std::string encode(const RespValue& value) {
    switch (value.type) {
        case RespValue::Type::SIMPLE_STRING:
            return "+" + value.str + "\r\n";
        case RespValue::Type::ERROR:
            return "-" + value.str + "\r\n";
        case RespValue::Type::INTEGER:
            return ":" + std::to_string(value.integer) + "\r\n";
        case RespValue::Type::BULK_STRING:
            return "$" + std::to_string(value.str.size()) + "\r\n" + value.str + "\r\n";
        case RespValue::Type::ARRAY: {
            std::string out = "*" + std::to_string(value.elements.size()) + "\r\n";
            for (const auto& element : value.elements) {
                out += encode(element);
            }
            return out;
        }
        case RespValue::Type::NIL:
        default:
            return "$-1\r\n";
    }
}

} // namespace resp

void RespParser::append(const char* data, size_t length) {
    buffer_.append(data, length);
}

std::optional<RespValue> RespParser::next() {
    if (offset_ >= buffer_.size()) {
        return std::nullopt;
    }

    size_t pos = offset_;
    RespValue value;
    if (!parseValue(pos, value)) {
        return std::nullopt;
    }
    offset_ = pos;
    compact();
    return value;
}

void RespParser::compact() {
    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    } else if (offset_ > 64 * 1024) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
}

bool RespParser::readLine(size_t& pos, std::string& line) const {
    size_t end = buffer_.find("\r\n", pos);
    if (end == std::string::npos) {
        return false;
    }
    line = buffer_.substr(pos, end - pos);
    pos = end + 2;
    return true;
}

int64_t RespParser::parseNumber(const std::string& text) const {
    try {
        size_t used = 0;
        int64_t value = std::stoll(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception&) {
        throw SyncError(SyncError::Category::PROTOCOL, "invalid RESP length or integer: '" + text + "'");
    }
}

bool RespParser::parseValue(size_t& pos, RespValue& out) const {
    if (pos >= buffer_.size()) {
        return false;
    }

    char prefix = buffer_[pos];
    size_t cursor = pos + 1;
    std::string line;
    if (!readLine(cursor, line)) {
        return false;
    }

    switch (prefix) {
        case '+':
            out = RespValue::simple(line);
            break;
        case '-':
            out = RespValue::error(line);
            break;
        case ':':
            out = RespValue::fromInteger(parseNumber(line));
            break;
        case '$': {
            int64_t length = parseNumber(line);
            if (length < 0) {
                out = RespValue::nil();
                break;
            }
            size_t size = static_cast<size_t>(length);
            if (buffer_.size() < cursor + size + 2) {
                return false;
            }
            if (buffer_[cursor + size] != '\r' || buffer_[cursor + size + 1] != '\n') {
                throw SyncError(SyncError::Category::PROTOCOL, "bulk string not terminated by CRLF");
            }
            out = RespValue::bulk(buffer_.substr(cursor, size));
            cursor += size + 2;
            break;
        }
        case '*': {
            int64_t count = parseNumber(line);
            if (count < 0) {
                out = RespValue::nil();
                break;
            }
            std::vector<RespValue> elements;
            elements.reserve(static_cast<size_t>(std::min<int64_t>(count, 1024)));
            for (int64_t i = 0; i < count; ++i) {
                RespValue element;
                if (!parseValue(cursor, element)) {
                    return false;
                }
                elements.push_back(std::move(element));
            }
            out = RespValue::array(std::move(elements));
            break;
        }
        default:
            throw SyncError(SyncError::Category::PROTOCOL,
                            std::string("unexpected RESP type byte '") + prefix + "'");
    }

    pos = cursor;
    return true;
}
