// JSON parser and canonical writer
#include "utils/json.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace fedcore {
namespace utils {

JsonValue JsonValue::array() {
    JsonValue v;
    v.type_ = ARRAY;
    return v;
}

JsonValue JsonValue::object() {
    JsonValue v;
    v.type_ = OBJECT;
    return v;
}

JsonValue JsonValue::fromNumbers(const std::vector<double>& values) {
    JsonValue v = array();
    v.array_value_.reserve(values.size());
    for (double d : values) {
        v.array_value_.emplace_back(d);
    }
    return v;
}

bool JsonValue::asBool() const {
    if (type_ != BOOL) throw std::runtime_error("JSON value is not a boolean");
    return bool_value_;
}

double JsonValue::asNumber() const {
    if (type_ != NUMBER) throw std::runtime_error("JSON value is not a number");
    return number_value_;
}

int JsonValue::asInt() const {
    int64_t value = asInt64();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw std::runtime_error("JSON number out of int range");
    }
    return static_cast<int>(value);
}

int64_t JsonValue::asInt64() const {
    // 2^63 is exactly representable; every double below it converts safely
    constexpr double LIMIT = 9223372036854775808.0;
    double value = asNumber();
    if (!(value >= -LIMIT && value < LIMIT)) {
        throw std::runtime_error("JSON number out of int64 range");
    }
    return static_cast<int64_t>(value);
}

const std::string& JsonValue::asString() const {
    if (type_ != STRING) throw std::runtime_error("JSON value is not a string");
    return string_value_;
}

const JsonValue::Array& JsonValue::asArray() const {
    if (type_ != ARRAY) throw std::runtime_error("JSON value is not an array");
    return array_value_;
}

const JsonValue::Object& JsonValue::asObject() const {
    if (type_ != OBJECT) throw std::runtime_error("JSON value is not an object");
    return object_value_;
}

std::vector<double> JsonValue::asNumbers() const {
    const auto& arr = asArray();
    std::vector<double> out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        out.push_back(item.asNumber());
    }
    return out;
}

void JsonValue::push_back(const JsonValue& value) {
    if (type_ != ARRAY) {
        type_ = ARRAY;
        array_value_.clear();
    }
    array_value_.push_back(value);
}

size_t JsonValue::size() const {
    if (type_ == ARRAY) return array_value_.size();
    if (type_ == OBJECT) return object_value_.size();
    return 0;
}

void JsonValue::set(const std::string& key, const JsonValue& value) {
    if (type_ != OBJECT) {
        type_ = OBJECT;
        object_value_.clear();
    }
    object_value_[key] = value;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    const auto& obj = asObject();
    auto it = obj.find(key);
    if (it == obj.end()) {
        static const JsonValue null_value;
        return null_value;
    }
    return it->second;
}

bool JsonValue::has(const std::string& key) const {
    if (type_ != OBJECT) return false;
    return object_value_.find(key) != object_value_.end();
}

std::string JsonValue::getString(const std::string& key, const std::string& default_value) const {
    if (!has(key) || (*this)[key].isNull()) return default_value;
    return (*this)[key].asString();
}

double JsonValue::getNumber(const std::string& key, double default_value) const {
    if (!has(key) || (*this)[key].isNull()) return default_value;
    return (*this)[key].asNumber();
}

int64_t JsonValue::getInt64(const std::string& key, int64_t default_value) const {
    if (!has(key) || (*this)[key].isNull()) return default_value;
    return (*this)[key].asInt64();
}

bool JsonValue::getBool(const std::string& key, bool default_value) const {
    if (!has(key) || (*this)[key].isNull()) return default_value;
    return (*this)[key].asBool();
}

namespace {

void writeString(std::string& out, const std::string& s) {
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

void writeNumber(std::string& out, double d) {
    if (!std::isfinite(d)) {
        throw std::runtime_error("Cannot encode non-finite number as JSON");
    }
    if (d == 0.0 && std::signbit(d)) {
        out += "-0.0";
        return;
    }
    // Integral values print without exponent so counters stay readable
    if (d == std::floor(d) && std::fabs(d) < 9.007199254740992e15) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
        out += buf;
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    out += buf;
}

void appendUtf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

void JsonValue::dumpTo(std::string& out) const {
    switch (type_) {
        case NULL_TYPE:
            out += "null";
            break;
        case BOOL:
            out += bool_value_ ? "true" : "false";
            break;
        case NUMBER:
            writeNumber(out, number_value_);
            break;
        case STRING:
            writeString(out, string_value_);
            break;
        case ARRAY: {
            out.push_back('[');
            bool first = true;
            for (const auto& item : array_value_) {
                if (!first) out.push_back(',');
                first = false;
                item.dumpTo(out);
            }
            out.push_back(']');
            break;
        }
        case OBJECT: {
            out.push_back('{');
            bool first = true;
            for (const auto& entry : object_value_) {
                if (!first) out.push_back(',');
                first = false;
                writeString(out, entry.first);
                out.push_back(':');
                entry.second.dumpTo(out);
            }
            out.push_back('}');
            break;
        }
    }
}

std::string JsonValue::dump() const {
    std::string out;
    dumpTo(out);
    return out;
}

bool JsonValue::operator==(const JsonValue& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case NULL_TYPE: return true;
        case BOOL: return bool_value_ == other.bool_value_;
        case NUMBER: return number_value_ == other.number_value_;
        case STRING: return string_value_ == other.string_value_;
        case ARRAY: return array_value_ == other.array_value_;
        case OBJECT: return object_value_ == other.object_value_;
    }
    return false;
}

JsonValue JsonParser::parse(const std::string& json) {
    size_t pos = 0;
    JsonValue value = parseValue(json, pos, 0);
    skipWhitespace(json, pos);
    if (pos != json.length()) {
        throw std::runtime_error("Trailing characters after JSON value");
    }
    return value;
}

JsonValue JsonParser::parseFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

void JsonParser::skipWhitespace(const std::string& json, size_t& pos) {
    while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        ++pos;
    }
}

JsonValue JsonParser::parseValue(const std::string& json, size_t& pos, int depth) {
    if (depth > MAX_DEPTH) {
        throw std::runtime_error("JSON nesting too deep");
    }
    skipWhitespace(json, pos);

    if (pos >= json.length()) {
        throw std::runtime_error("Unexpected end of JSON");
    }

    char ch = json[pos];
    if (ch == '{') return parseObject(json, pos, depth + 1);
    if (ch == '[') return parseArray(json, pos, depth + 1);
    if (ch == '"') return JsonValue(parseString(json, pos));
    if (ch == 't' || ch == 'f' || ch == 'n') return parseLiteral(json, pos);
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) return parseNumber(json, pos);

    throw std::runtime_error(std::string("Unexpected character in JSON: ") + ch);
}

JsonValue JsonParser::parseObject(const std::string& json, size_t& pos, int depth) {
    JsonValue obj = JsonValue::object();

    ++pos; // Skip '{'
    skipWhitespace(json, pos);

    if (pos < json.length() && json[pos] == '}') {
        ++pos;
        return obj;
    }

    while (true) {
        skipWhitespace(json, pos);
        if (pos >= json.length() || json[pos] != '"') {
            throw std::runtime_error("Expected string key in object");
        }
        std::string key = parseString(json, pos);

        skipWhitespace(json, pos);
        if (pos >= json.length() || json[pos] != ':') {
            throw std::runtime_error("Expected ':' after object key");
        }
        ++pos;

        obj.set(key, parseValue(json, pos, depth));

        skipWhitespace(json, pos);
        if (pos < json.length() && json[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < json.length() && json[pos] == '}') {
            ++pos;
            break;
        }
        throw std::runtime_error("Expected ',' or '}' in object");
    }

    return obj;
}

JsonValue JsonParser::parseArray(const std::string& json, size_t& pos, int depth) {
    JsonValue arr = JsonValue::array();

    ++pos; // Skip '['
    skipWhitespace(json, pos);

    if (pos < json.length() && json[pos] == ']') {
        ++pos;
        return arr;
    }

    while (true) {
        arr.push_back(parseValue(json, pos, depth));

        skipWhitespace(json, pos);
        if (pos < json.length() && json[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < json.length() && json[pos] == ']') {
            ++pos;
            break;
        }
        throw std::runtime_error("Expected ',' or ']' in array");
    }

    return arr;
}

std::string JsonParser::parseString(const std::string& json, size_t& pos) {
    ++pos; // Skip opening '"'

    std::string result;
    while (pos < json.length() && json[pos] != '"') {
        if (json[pos] == '\\') {
            ++pos;
            if (pos >= json.length()) {
                throw std::runtime_error("Unexpected end of string");
            }

            switch (json[pos]) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos + 4 >= json.length()) {
                        throw std::runtime_error("Truncated unicode escape");
                    }
                    unsigned int cp = 0;
                    for (int i = 1; i <= 4; ++i) {
                        char h = json[pos + i];
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= h - '0';
                        else if (h >= 'a' && h <= 'f') cp |= h - 'a' + 10;
                        else if (h >= 'A' && h <= 'F') cp |= h - 'A' + 10;
                        else throw std::runtime_error("Invalid unicode escape");
                    }
                    appendUtf8(result, cp);
                    pos += 4;
                    break;
                }
                default:
                    throw std::runtime_error("Invalid escape sequence");
            }
        } else {
            result += json[pos];
        }
        ++pos;
    }

    if (pos >= json.length()) {
        throw std::runtime_error("Unterminated string");
    }

    ++pos; // Skip closing '"'
    return result;
}

JsonValue JsonParser::parseNumber(const std::string& json, size_t& pos) {
    size_t start = pos;

    if (json[pos] == '-') {
        ++pos;
    }
    while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
        ++pos;
    }
    if (pos < json.length() && json[pos] == '.') {
        ++pos;
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            ++pos;
        }
    }
    if (pos < json.length() && (json[pos] == 'e' || json[pos] == 'E')) {
        ++pos;
        if (pos < json.length() && (json[pos] == '+' || json[pos] == '-')) {
            ++pos;
        }
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            ++pos;
        }
    }

    std::string num_str = json.substr(start, pos - start);
    char* end = nullptr;
    double value = std::strtod(num_str.c_str(), &end);
    if (num_str.empty() || end != num_str.c_str() + num_str.size()) {
        throw std::runtime_error("Invalid number in JSON: " + num_str);
    }
    if (!std::isfinite(value)) {
        throw std::runtime_error("Number out of range in JSON: " + num_str);
    }
    return JsonValue(value);
}

JsonValue JsonParser::parseLiteral(const std::string& json, size_t& pos) {
    if (json.compare(pos, 4, "true") == 0) {
        pos += 4;
        return JsonValue(true);
    }
    if (json.compare(pos, 5, "false") == 0) {
        pos += 5;
        return JsonValue(false);
    }
    if (json.compare(pos, 4, "null") == 0) {
        pos += 4;
        return JsonValue();
    }
    throw std::runtime_error("Invalid literal in JSON");
}

} // namespace utils
} // namespace fedcore
