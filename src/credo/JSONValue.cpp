//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.cpp
// Purpose: Minimalistic JSON parser and serializer using only std library
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <charconv>
#include <system_error>
#include <stdexcept>
#include <iomanip>
#include <limits>
#include "credo/JSONValue.h"
#include "logging/Logger.h"

namespace credo {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Minimal recursive JSON parser
// -------------------------------
namespace {
// Deeper documents are rejected instead of exhausting the stack.
constexpr std::size_t kMaxNestingDepth = 128;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    std::size_t depth{0};

    struct NestingGuard {
        std::size_t& depth;
        explicit NestingGuard(std::size_t& d) : depth(d) {
            if (++depth > kMaxNestingDepth) {
                throw std::runtime_error("JSON nesting exceeds " + std::to_string(kMaxNestingDepth) + " levels");
            }
        }
        ~NestingGuard() { --depth; }
    };

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) throw std::runtime_error("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i + k];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10 + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10 + static_cast<unsigned int>(h - 'A');
            else throw std::runtime_error("Invalid hex in unicode escape");
        }
        i += 4;
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') throw std::runtime_error("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        bool closed = false;
        while (i < s.size()) {
            char c = s[i++];
            if (c == '"') { closed = true; break; }
            if (c == '\\') {
                if (i >= s.size()) throw std::runtime_error("Invalid escape");
                char e = s[i++];
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        unsigned int code = parseHex4();
                        // Combine UTF-16 surrogate pairs
                        if (code >= 0xD800 && code <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) throw std::runtime_error("Invalid surrogate pair");
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        }
                        appendUtf8(out, code);
                        break;
                    }
                    default: throw std::runtime_error("Unknown escape");
                }
            } else {
                out.push_back(c);
            }
        }
        if (!closed) throw std::runtime_error("Unterminated string");
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) throw std::runtime_error("Unexpected character in JSON");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            int64_t iv = 0;
            const auto res = std::from_chars(num.data(), num.data() + num.size(), iv);
            if (res.ec == std::errc() && res.ptr == num.data() + num.size()) {
                return JSONValue(iv);
            }
            // Integers beyond int64 degrade to double
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Number out of range: " + num);
        } catch (const std::invalid_argument&) {
            throw std::runtime_error("Invalid number: " + num);
        }
    }

    JSONValue parseArray() {
        if (!match('[')) throw std::runtime_error("Expected '['");
        NestingGuard guard(depth);
        JSONValue::Array arr;
        skipWs();
        if (match(']')) return JSONValue(arr);
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            skipWs();
            if (match(']')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in array");
        }
        return JSONValue(arr);
    }

    JSONValue parseObject() {
        if (!match('{')) throw std::runtime_error("Expected '{'");
        NestingGuard guard(depth);
        JSONValue::Object obj;
        skipWs();
        if (match('}')) return JSONValue(obj);
        while (true) {
            std::string key = parseString();
            skipWs();
            if (!match(':')) throw std::runtime_error("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            skipWs();
            if (match('}')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in object");
        }
        return JSONValue(obj);
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) throw std::runtime_error("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') { // true
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        }
        if (c == 'f') { // false
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        }
        if (c == 'n') { // null
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        }
        // number
        return parseNumber();
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

bool numericValue(const JSONValue& v, double& out) {
    if (std::holds_alternative<int64_t>(v.value)) {
        out = static_cast<double>(std::get<int64_t>(v.value));
        return true;
    }
    if (std::holds_alternative<double>(v.value)) {
        out = std::get<double>(v.value);
        return true;
    }
    return false;
}
} // namespace

bool operator==(const JSONValue& lhs, const JSONValue& rhs) {
    double a = 0.0, b = 0.0;
    if (numericValue(lhs, a) && numericValue(rhs, b)) {
        if (std::holds_alternative<int64_t>(lhs.value) && std::holds_alternative<int64_t>(rhs.value)) {
            return std::get<int64_t>(lhs.value) == std::get<int64_t>(rhs.value);
        }
        return a == b;
    }
    if (lhs.value.index() != rhs.value.index()) {
        return false;
    }
    if (lhs.isArray()) {
        const auto& la = std::get<JSONValue::Array>(lhs.value);
        const auto& ra = std::get<JSONValue::Array>(rhs.value);
        if (la.size() != ra.size()) return false;
        for (std::size_t k = 0; k < la.size(); ++k) {
            const JSONValue nullValue;
            const JSONValue& l = la[k] ? *la[k] : nullValue;
            const JSONValue& r = ra[k] ? *ra[k] : nullValue;
            if (!(l == r)) return false;
        }
        return true;
    }
    if (lhs.isObject()) {
        const auto& lo = std::get<JSONValue::Object>(lhs.value);
        const auto& ro = std::get<JSONValue::Object>(rhs.value);
        if (lo.size() != ro.size()) return false;
        for (const auto& [key, lval] : lo) {
            auto it = ro.find(key);
            if (it == ro.end()) return false;
            const JSONValue nullValue;
            const JSONValue& l = lval ? *lval : nullValue;
            const JSONValue& r = it->second ? *it->second : nullValue;
            if (!(l == r)) return false;
        }
        return true;
    }
    return lhs.value == rhs.value;
}

// Simple JSON serialization
std::string serializeJSONValue(const JSONValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::ostringstream oss;
            writeEscaped(oss, v);
            return oss.str();
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            std::ostringstream oss;
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                oss << (v[i] ? serializeJSONValue(*v[i]) : std::string("null"));
            }
            oss << ']';
            return oss.str();
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::ostringstream oss;
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':' << (val ? serializeJSONValue(*val) : std::string("null"));
            }
            oss << '}';
            return oss.str();
        } else {
            return "null";
        }
    }, value.get());
}

JSONValue parseJSON(const std::string& json) {
    FUNC_SCOPE();
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        throw std::runtime_error("Trailing characters after JSON value");
    }
    return v;
}

const char* kindName(const JSONValue& value) {
    switch (value.value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2:
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
        default: return "unknown";
    }
}

const JSONValue* findMember(const JSONValue& object, const std::string& key) {
    if (!object.isObject()) {
        return nullptr;
    }
    const auto& obj = std::get<JSONValue::Object>(object.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> getStringMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = findMember(object, key);
    if (v == nullptr || !v->isString()) {
        return std::nullopt;
    }
    return std::get<std::string>(v->value);
}

std::optional<int64_t> getIntegerMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = findMember(object, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    if (std::holds_alternative<double>(v->value)) {
        // [-2^63, 2^63) converts without overflow; NaN fails both comparisons.
        const double d = std::get<double>(v->value);
        if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
            return std::nullopt;
        }
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

JSONValue makeObject(std::initializer_list<std::pair<std::string, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [key, val] : members) {
        obj[key] = std::make_shared<JSONValue>(val);
    }
    return JSONValue(std::move(obj));
}

JSONValue makeArray(std::initializer_list<JSONValue> items) {
    JSONValue::Array arr;
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item));
    }
    return JSONValue(std::move(arr));
}

JSONValue makeStringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item));
    }
    return JSONValue(std::move(arr));
}

} // namespace credo
