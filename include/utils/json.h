// JSON value, parser and canonical writer used for the wire format
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <stdexcept>

namespace fedcore {
namespace utils {

class JsonValue {
public:
    enum Type {
        NULL_TYPE,
        BOOL,
        NUMBER,
        STRING,
        ARRAY,
        OBJECT
    };

    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;  // ordered keys give canonical output

    JsonValue() : type_(NULL_TYPE) {}
    JsonValue(bool b) : type_(BOOL), bool_value_(b) {}
    JsonValue(double n) : type_(NUMBER), number_value_(n) {}
    JsonValue(int n) : type_(NUMBER), number_value_(static_cast<double>(n)) {}
    JsonValue(int64_t n) : type_(NUMBER), number_value_(static_cast<double>(n)) {}
    JsonValue(uint64_t n) : type_(NUMBER), number_value_(static_cast<double>(n)) {}
    JsonValue(const std::string& s) : type_(STRING), string_value_(s) {}
    JsonValue(const char* s) : type_(STRING), string_value_(s) {}

    static JsonValue array();
    static JsonValue object();
    static JsonValue fromNumbers(const std::vector<double>& values);

    Type getType() const { return type_; }
    bool isNull() const { return type_ == NULL_TYPE; }
    bool isObject() const { return type_ == OBJECT; }
    bool isArray() const { return type_ == ARRAY; }

    bool asBool() const;
    double asNumber() const;
    // Truncate toward zero; throw std::runtime_error when out of range
    int asInt() const;
    int64_t asInt64() const;
    const std::string& asString() const;
    const Array& asArray() const;
    const Object& asObject() const;
    std::vector<double> asNumbers() const;

    // Array operations
    void push_back(const JsonValue& value);
    size_t size() const;
    const JsonValue& operator[](size_t index) const { return asArray().at(index); }

    // Object operations
    void set(const std::string& key, const JsonValue& value);
    const JsonValue& operator[](const std::string& key) const;
    bool has(const std::string& key) const;

    // Typed lookups with defaults for optional fields
    std::string getString(const std::string& key, const std::string& default_value = "") const;
    double getNumber(const std::string& key, double default_value = 0.0) const;
    int64_t getInt64(const std::string& key, int64_t default_value = 0) const;
    bool getBool(const std::string& key, bool default_value = false) const;

    // Compact output with sorted object keys
    std::string dump() const;

    bool operator==(const JsonValue& other) const;
    bool operator!=(const JsonValue& other) const { return !(*this == other); }

private:
    Type type_;
    bool bool_value_ = false;
    double number_value_ = 0.0;
    std::string string_value_;
    Array array_value_;
    Object object_value_;

    void dumpTo(std::string& out) const;
};

class JsonParser {
public:
    static JsonValue parse(const std::string& json);
    static JsonValue parseFile(const std::string& filename);

private:
    static JsonValue parseValue(const std::string& json, size_t& pos, int depth);
    static JsonValue parseObject(const std::string& json, size_t& pos, int depth);
    static JsonValue parseArray(const std::string& json, size_t& pos, int depth);
    static std::string parseString(const std::string& json, size_t& pos);
    static JsonValue parseNumber(const std::string& json, size_t& pos);
    static JsonValue parseLiteral(const std::string& json, size_t& pos);
    static void skipWhitespace(const std::string& json, size_t& pos);

    static constexpr int MAX_DEPTH = 256;
};

} // namespace utils
} // namespace fedcore
