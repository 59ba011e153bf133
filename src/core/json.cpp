// AceProxy - AceStream Multiplexing Proxy
// Minimal JSON Implementation

#include "aceproxy/core/json.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>

namespace aceproxy {
namespace core {

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue nullValue;
    if (!isObject()) return nullValue;
    auto it = objectValue.find(key);
    return it != objectValue.end() ? it->second : nullValue;
}

// =============================================================================
// Parser
// =============================================================================

namespace {

using ParseResult = Result<JsonValue, Error>;

// Nesting guard; engine responses and configs are a few levels deep at most.
constexpr size_t kMaxDepth = 64;

ParseResult parseFailure(const std::string& message, size_t pos) {
    return ParseResult::error(Error(ErrorCode::InvalidArgument,
                                    "JSON parse error: " + message,
                                    "offset " + std::to_string(pos)));
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0), depth_(0) {}

    ParseResult parse() {
        skipWhitespace();
        auto result = parseValue();
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return parseFailure("unexpected characters after JSON value", pos_);
        }
        return result;
    }

private:
    const std::string& input_;
    size_t pos_;
    size_t depth_;

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (peek() == c) {
            consume();
            return true;
        }
        return false;
    }

    ParseResult parseValue() {
        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        if (c == '\0') {
            return parseFailure("unexpected end of input", pos_);
        }
        return parseFailure("unexpected character '" + std::string(1, c) + "'", pos_);
    }

    ParseResult parseString() {
        if (!match('"')) {
            return parseFailure("expected '\"'", pos_);
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (c != '\\') {
                result += c;
                continue;
            }
            char escaped = consume();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > input_.size()) {
                        return parseFailure("truncated \\u escape", pos_);
                    }
                    uint32_t cp = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = consume();
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
                        else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
                        else return parseFailure("invalid \\u escape", pos_);
                    }
                    appendUtf8(result, cp);
                    break;
                }
                default:
                    return parseFailure("invalid escape sequence", pos_);
            }
        }

        if (!match('"')) {
            return parseFailure("unterminated string", pos_);
        }

        JsonValue value;
        value.type = JsonType::String;
        value.stringValue = std::move(result);
        return ParseResult::success(std::move(value));
    }

    ParseResult parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();

        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

        if (peek() == '.') {
            consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        try {
            JsonValue value;
            value.type = JsonType::Number;
            value.numberValue = std::stod(numStr);
            return ParseResult::success(std::move(value));
        } catch (const std::exception&) {
            return parseFailure("invalid number '" + numStr + "'", start);
        }
    }

    ParseResult parseBool() {
        JsonValue value;
        value.type = JsonType::Boolean;
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            value.boolValue = true;
            return ParseResult::success(std::move(value));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            value.boolValue = false;
            return ParseResult::success(std::move(value));
        }
        return parseFailure("expected 'true' or 'false'", pos_);
    }

    ParseResult parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return ParseResult::success(JsonValue{});
        }
        return parseFailure("expected 'null'", pos_);
    }

    ParseResult parseArray() {
        if (!match('[')) {
            return parseFailure("expected '['", pos_);
        }
        if (++depth_ > kMaxDepth) {
            return parseFailure("nesting too deep", pos_);
        }

        JsonValue value;
        value.type = JsonType::Array;

        skipWhitespace();
        if (!match(']')) {
            while (true) {
                auto element = parseValue();
                if (element.isError()) {
                    return element;
                }
                value.arrayValue.push_back(std::move(element).value());

                skipWhitespace();
                if (match(']')) break;
                if (!match(',')) {
                    return parseFailure("expected ',' or ']' in array", pos_);
                }
            }
        }

        --depth_;
        return ParseResult::success(std::move(value));
    }

    ParseResult parseObject() {
        if (!match('{')) {
            return parseFailure("expected '{'", pos_);
        }
        if (++depth_ > kMaxDepth) {
            return parseFailure("nesting too deep", pos_);
        }

        JsonValue value;
        value.type = JsonType::Object;

        skipWhitespace();
        if (!match('}')) {
            while (true) {
                skipWhitespace();
                auto keyResult = parseString();
                if (keyResult.isError()) {
                    return parseFailure("expected string key in object", pos_);
                }
                std::string key = keyResult.value().stringValue;

                skipWhitespace();
                if (!match(':')) {
                    return parseFailure("expected ':' after key", pos_);
                }

                auto member = parseValue();
                if (member.isError()) {
                    return member;
                }
                value.objectValue[key] = std::move(member).value();

                skipWhitespace();
                if (match('}')) break;
                if (!match(',')) {
                    return parseFailure("expected ',' or '}' in object", pos_);
                }
            }
        }

        --depth_;
        return ParseResult::success(std::move(value));
    }
};

} // anonymous namespace

Result<JsonValue, Error> parseJson(const std::string& input) {
    JsonParser parser(input);
    return parser.parse();
}

// =============================================================================
// Writer
// =============================================================================

std::string escapeJson(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

void JsonWriter::separate() {
    if (afterKey_) {
        afterKey_ = false;
        return;
    }
    if (!hasElement_.empty()) {
        if (hasElement_.back()) {
            out_ << ',';
        }
        hasElement_.back() = true;
    }
}

JsonWriter& JsonWriter::beginObject() {
    separate();
    out_ << '{';
    hasElement_.push_back(false);
    return *this;
}

JsonWriter& JsonWriter::endObject() {
    out_ << '}';
    hasElement_.pop_back();
    return *this;
}

JsonWriter& JsonWriter::beginArray() {
    separate();
    out_ << '[';
    hasElement_.push_back(false);
    return *this;
}

JsonWriter& JsonWriter::endArray() {
    out_ << ']';
    hasElement_.pop_back();
    return *this;
}

JsonWriter& JsonWriter::key(const std::string& name) {
    separate();
    out_ << '"' << escapeJson(name) << "\":";
    afterKey_ = true;
    return *this;
}

JsonWriter& JsonWriter::value(const std::string& v) {
    separate();
    out_ << '"' << escapeJson(v) << '"';
    return *this;
}

JsonWriter& JsonWriter::value(const char* v) {
    return value(std::string(v != nullptr ? v : ""));
}

JsonWriter& JsonWriter::value(bool v) {
    separate();
    out_ << (v ? "true" : "false");
    return *this;
}

JsonWriter& JsonWriter::value(int64_t v) {
    separate();
    out_ << v;
    return *this;
}

JsonWriter& JsonWriter::value(uint64_t v) {
    separate();
    out_ << v;
    return *this;
}

JsonWriter& JsonWriter::value(int v) {
    return value(static_cast<int64_t>(v));
}

JsonWriter& JsonWriter::value(double v) {
    if (!std::isfinite(v)) {
        return null();
    }
    separate();
    out_ << std::setprecision(std::numeric_limits<double>::digits10) << v;
    return *this;
}

JsonWriter& JsonWriter::null() {
    separate();
    out_ << "null";
    return *this;
}

} // namespace core
} // namespace aceproxy
