// AceProxy - AceStream Multiplexing Proxy
// Minimal JSON support
//
// Responsibilities:
// - Parse JSON documents (configuration files, engine API responses)
// - Emit compact JSON for HTTP responses and structured log lines
//
// Only the subset of JSON the proxy exchanges is supported: \uXXXX escapes
// are decoded for the Basic Multilingual Plane, numbers are stored as double.

#ifndef ACEPROXY_CORE_JSON_HPP
#define ACEPROXY_CORE_JSON_HPP

#include <cstdint>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "aceproxy/core/error_codes.hpp"
#include "aceproxy/core/result.hpp"

namespace aceproxy {
namespace core {

enum class JsonType {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief Parsed JSON value.
 *
 * Lookups on missing keys or wrong types return a shared null value, so
 * nested access like root["response"]["playback_url"] never throws.
 */
struct JsonValue {
    JsonType type = JsonType::Null;
    bool boolValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::map<std::string, JsonValue> objectValue;

    bool isNull() const { return type == JsonType::Null; }
    bool isBool() const { return type == JsonType::Boolean; }
    bool isNumber() const { return type == JsonType::Number; }
    bool isString() const { return type == JsonType::String; }
    bool isArray() const { return type == JsonType::Array; }
    bool isObject() const { return type == JsonType::Object; }

    bool getBool(bool defaultVal = false) const {
        return isBool() ? boolValue : defaultVal;
    }

    int64_t getInt(int64_t defaultVal = 0) const {
        return isNumber() ? static_cast<int64_t>(numberValue) : defaultVal;
    }

    double getDouble(double defaultVal = 0.0) const {
        return isNumber() ? numberValue : defaultVal;
    }

    std::string getString(const std::string& defaultVal = "") const {
        return isString() ? stringValue : defaultVal;
    }

    bool contains(const std::string& key) const {
        return isObject() && objectValue.find(key) != objectValue.end();
    }

    const JsonValue& operator[](const std::string& key) const;
};

/**
 * @brief Parse a complete JSON document.
 *
 * @return The root value, or InvalidArgument with the parse failure
 */
Result<JsonValue, Error> parseJson(const std::string& input);

/**
 * @brief Escape a string for inclusion inside JSON quotes.
 */
std::string escapeJson(const std::string& str);

/**
 * @brief Compact JSON emitter.
 *
 * Tracks comma placement so callers only describe structure:
 * @code
 * JsonWriter w;
 * w.beginObject();
 * w.key("status").value("ok");
 * w.key("peers").value(int64_t{12});
 * w.endObject();
 * std::string body = w.str();
 * @endcode
 */
class JsonWriter {
public:
    JsonWriter& beginObject();
    JsonWriter& endObject();
    JsonWriter& beginArray();
    JsonWriter& endArray();
    JsonWriter& key(const std::string& name);

    JsonWriter& value(const std::string& v);
    JsonWriter& value(const char* v);
    JsonWriter& value(bool v);
    JsonWriter& value(int64_t v);
    JsonWriter& value(uint64_t v);
    JsonWriter& value(int v);
    JsonWriter& value(double v);
    JsonWriter& null();

    std::string str() const { return out_.str(); }

private:
    void separate();

    std::ostringstream out_;
    // One entry per open container: true once it holds an element.
    std::vector<bool> hasElement_;
    bool afterKey_ = false;
};

} // namespace core
} // namespace aceproxy

#endif // ACEPROXY_CORE_JSON_HPP
