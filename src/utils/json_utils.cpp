#include "utils/json_utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace voicebridge {
namespace utils {

JsonValue JsonValue::null_value_;

const JsonValue& JsonValue::getProperty(const std::string& key) const {
    auto it = object_value_.find(key);
    return (it != object_value_.end()) ? it->second : null_value_;
}

std::string JsonValue::getString(const std::string& key, const std::string& fallback) const {
    const auto& value = getProperty(key);
    return value.isString() ? value.asString() : fallback;
}

double JsonValue::getNumber(const std::string& key, double fallback) const {
    const auto& value = getProperty(key);
    return value.isNumber() ? value.asNumber() : fallback;
}

bool JsonValue::getBool(const std::string& key, bool fallback) const {
    const auto& value = getProperty(key);
    return value.isBool() ? value.asBool() : fallback;
}

JsonValue JsonParser::parse(const std::string& json) {
    size_t pos = 0;
    skipWhitespace(json, pos);
    JsonValue value = parseValue(json, pos);
    skipWhitespace(json, pos);
    if (pos != json.length()) {
        throw std::runtime_error("Trailing characters after JSON value");
    }
    return value;
}

std::string JsonParser::stringify(const JsonValue& value) {
    return stringifyValue(value);
}

JsonValue JsonParser::parseValue(const std::string& json, size_t& pos) {
    skipWhitespace(json, pos);
    
    if (pos >= json.length()) {
        throw std::runtime_error("Unexpected end of JSON");
    }
    
    char c = json[pos];
    
    if (c == '{') {
        return parseObject(json, pos);
    } else if (c == '[') {
        return parseArray(json, pos);
    } else if (c == '"') {
        return parseString(json, pos);
    } else if (c == 't' || c == 'f' || c == 'n') {
        return parseLiteral(json, pos);
    } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parseNumber(json, pos);
    } else {
        throw std::runtime_error("Unexpected character: " + std::string(1, c));
    }
}

JsonValue JsonParser::parseObject(const std::string& json, size_t& pos) {
    JsonValue obj;
    obj.setObject();
    
    pos++; // Skip '{'
    skipWhitespace(json, pos);
    
    if (pos < json.length() && json[pos] == '}') {
        pos++;
        return obj;
    }
    
    while (pos < json.length()) {
        skipWhitespace(json, pos);
        
        if (pos >= json.length() || json[pos] != '"') {
            throw std::runtime_error("Expected string key in object");
        }
        
        JsonValue key = parseString(json, pos);
        skipWhitespace(json, pos);
        
        if (pos >= json.length() || json[pos] != ':') {
            throw std::runtime_error("Expected ':' after object key");
        }
        pos++;
        
        JsonValue value = parseValue(json, pos);
        obj.setObjectProperty(key.asString(), value);
        
        skipWhitespace(json, pos);
        
        if (pos >= json.length()) {
            throw std::runtime_error("Unexpected end of JSON in object");
        }
        
        if (json[pos] == '}') {
            pos++;
            return obj;
        } else if (json[pos] == ',') {
            pos++;
        } else {
            throw std::runtime_error("Expected ',' or '}' in object");
        }
    }
    
    throw std::runtime_error("Unterminated object");
}

JsonValue JsonParser::parseArray(const std::string& json, size_t& pos) {
    JsonValue arr;
    arr.setArray();
    
    pos++; // Skip '['
    skipWhitespace(json, pos);
    
    if (pos < json.length() && json[pos] == ']') {
        pos++;
        return arr;
    }
    
    while (pos < json.length()) {
        JsonValue value = parseValue(json, pos);
        arr.addArrayElement(value);
        
        skipWhitespace(json, pos);
        
        if (pos >= json.length()) {
            throw std::runtime_error("Unexpected end of JSON in array");
        }
        
        if (json[pos] == ']') {
            pos++;
            return arr;
        } else if (json[pos] == ',') {
            pos++;
            skipWhitespace(json, pos);
        } else {
            throw std::runtime_error("Expected ',' or ']' in array");
        }
    }
    
    throw std::runtime_error("Unterminated array");
}

uint32_t JsonParser::parseHex4(const std::string& json, size_t pos) {
    if (pos + 4 > json.length()) {
        throw std::runtime_error("Truncated unicode escape");
    }
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        char h = json[pos + i];
        value <<= 4;
        if (h >= '0' && h <= '9') {
            value |= static_cast<uint32_t>(h - '0');
        } else if (h >= 'a' && h <= 'f') {
            value |= static_cast<uint32_t>(h - 'a' + 10);
        } else if (h >= 'A' && h <= 'F') {
            value |= static_cast<uint32_t>(h - 'A' + 10);
        } else {
            throw std::runtime_error("Invalid unicode escape");
        }
    }
    return value;
}

void JsonParser::appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

JsonValue JsonParser::parseString(const std::string& json, size_t& pos) {
    pos++; // Skip opening '"'
    std::string result;
    
    while (pos < json.length()) {
        char c = json[pos];
        
        if (c == '"') {
            pos++;
            return JsonValue(result);
        } else if (c == '\\') {
            pos++;
            if (pos >= json.length()) {
                throw std::runtime_error("Unexpected end of JSON in string escape");
            }
            
            char escaped = json[pos];
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
                    uint32_t codepoint = parseHex4(json, pos + 1);
                    pos += 4;
                    // Surrogate pair
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                        pos + 6 < json.length() && json[pos + 1] == '\\' && json[pos + 2] == 'u') {
                        uint32_t low = parseHex4(json, pos + 3);
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                            pos += 6;
                        }
                    }
                    appendUtf8(result, codepoint);
                    break;
                }
                default:
                    throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
            }
        } else {
            result += c;
        }
        
        pos++;
    }
    
    throw std::runtime_error("Unterminated string");
}

JsonValue JsonParser::parseNumber(const std::string& json, size_t& pos) {
    size_t start = pos;
    
    if (json[pos] == '-') {
        pos++;
    }
    
    if (pos >= json.length() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
        throw std::runtime_error("Invalid number format");
    }
    
    if (json[pos] == '0') {
        pos++;
    } else {
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            pos++;
        }
    }
    
    if (pos < json.length() && json[pos] == '.') {
        pos++;
        if (pos >= json.length() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
            throw std::runtime_error("Invalid number format");
        }
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            pos++;
        }
    }
    
    if (pos < json.length() && (json[pos] == 'e' || json[pos] == 'E')) {
        pos++;
        if (pos < json.length() && (json[pos] == '+' || json[pos] == '-')) {
            pos++;
        }
        if (pos >= json.length() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
            throw std::runtime_error("Invalid number format");
        }
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            pos++;
        }
    }
    
    std::string numberStr = json.substr(start, pos - start);
    std::istringstream iss(numberStr);
    iss.imbue(std::locale::classic());
    double value = 0.0;
    iss >> value;
    return JsonValue(value);
}

JsonValue JsonParser::parseLiteral(const std::string& json, size_t& pos) {
    if (json.compare(pos, 4, "true") == 0) {
        pos += 4;
        return JsonValue(true);
    } else if (json.compare(pos, 5, "false") == 0) {
        pos += 5;
        return JsonValue(false);
    } else if (json.compare(pos, 4, "null") == 0) {
        pos += 4;
        return JsonValue();
    } else {
        throw std::runtime_error("Invalid literal");
    }
}

void JsonParser::skipWhitespace(const std::string& json, size_t& pos) {
    while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        pos++;
    }
}

std::string JsonParser::stringifyNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    // Integral values (sequence numbers, millisecond timestamps) print without exponent
    if (std::floor(value) == value && std::fabs(value) < 9.0e15) {
        return std::to_string(static_cast<int64_t>(value));
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(std::numeric_limits<double>::max_digits10 - 2) << value;
    return oss.str();
}

std::string JsonParser::stringifyValue(const JsonValue& value) {
    switch (value.getType()) {
        case JsonType::NULL_VALUE:
            return "null";
        case JsonType::BOOLEAN:
            return value.asBool() ? "true" : "false";
        case JsonType::NUMBER:
            return stringifyNumber(value.asNumber());
        case JsonType::STRING:
            return "\"" + escapeString(value.asString()) + "\"";
        case JsonType::ARRAY: {
            std::string result = "[";
            const auto& arr = value.asArray();
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) result += ",";
                result += stringifyValue(arr[i]);
            }
            result += "]";
            return result;
        }
        case JsonType::OBJECT: {
            std::string result = "{";
            const auto& obj = value.asObject();
            bool first = true;
            for (const auto& pair : obj) {
                if (!first) result += ",";
                result += "\"" + escapeString(pair.first) + "\":" + stringifyValue(pair.second);
                first = false;
            }
            result += "}";
            return result;
        }
    }
    return "null";
}

std::string JsonParser::escapeString(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // namespace utils
} // namespace voicebridge
