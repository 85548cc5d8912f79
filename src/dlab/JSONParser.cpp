//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict recursive-descent JSON parser and serializer using only the std library
//==========================================================================================================

#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "dlab/JSONValue.h"
#include "logging/Logger.h"


namespace dlab {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
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
// Recursive JSON parser
// -------------------------------
namespace {
struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    std::size_t depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const {
        throw JSONParseError(what, i);
    }

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

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
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

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
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
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by \uDC00-\uDFFF
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid fraction");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Out of int64 range: fall through to double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec == std::errc() && ptr == last) {
            return JSONValue(d);
        }
        if (ec == std::errc::result_out_of_range && decimalMagnitude(first, last) < 0) {
            // Too small for a double: rounds to zero, keeping the sign.
            return JSONValue(*first == '-' ? -0.0 : 0.0);
        }
        fail("Number out of range");
    }

    // Power of ten of the leading significant digit of an already validated JSON number.
    static long decimalMagnitude(const char* first, const char* last) {
        const char* p = first;
        if (*p == '-') ++p;
        long intDigits = 0;
        bool significant = false;
        for (; p < last && std::isdigit(static_cast<unsigned char>(*p)); ++p) {
            if (*p != '0') significant = true;
            if (significant) ++intDigits;
        }
        long fractionZeros = 0;
        if (p < last && *p == '.') {
            for (++p; p < last && std::isdigit(static_cast<unsigned char>(*p)); ++p) {
                if (!significant && *p == '0') ++fractionZeros;
                else significant = true;
            }
        }
        long exponent = 0;
        if (p < last && (*p == 'e' || *p == 'E')) {
            ++p;
            bool negative = false;
            if (*p == '-' || *p == '+') negative = (*p++ == '-');
            for (; p < last; ++p) {
                if (exponent < 100000) exponent = exponent * 10 + (*p - '0');
            }
            if (negative) exponent = -exponent;
        }
        return intDigits > 0 ? intDigits - 1 + exponent : exponent - fractionZeros - 1;
    }

    void enter() {
        if (++depth > kMaxJSONDepth) fail("Nesting too deep");
    }

    JSONValue parseArray() {
        enter();
        ++i; // '['
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        enter();
        ++i; // '{'
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') {
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
            fail("Invalid literal");
        }
        if (c == 'f') {
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
            fail("Invalid literal");
        }
        if (c == 'n') {
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
            fail("Invalid literal");
        }
        return parseNumber();
    }

    JSONValue parseDocument() {
        JSONValue v = parseValue();
        skipWs();
        if (i != s.size()) fail("Unexpected trailing characters");
        return v;
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
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeIndent(std::ostringstream& oss, int indent, int level) {
    if (indent < 0) return;
    oss << '\n';
    for (int k = 0; k < indent * level; ++k) oss << ' ';
}

void writeValue(std::ostringstream& oss, const JSONValue& value, int indent, int level) {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                oss << std::format("{}", v);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                writeIndent(oss, indent, level + 1);
                if (v[k]) writeValue(oss, *v[k], indent, level + 1); else oss << "null";
            }
            if (!v.empty()) writeIndent(oss, indent, level);
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeIndent(oss, indent, level + 1);
                writeEscaped(oss, key);
                oss << (indent >= 0 ? ": " : ":");
                if (val) writeValue(oss, *val, indent, level + 1); else oss << "null";
            }
            if (!v.empty()) writeIndent(oss, indent, level);
            oss << '}';
        }
    }, value.get());
}

std::optional<double> numberOf(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) return static_cast<double>(std::get<int64_t>(v.value));
    if (std::holds_alternative<double>(v.value)) return std::get<double>(v.value);
    return std::nullopt;
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    return p.parseDocument();
}

std::optional<JSONValue> TryParseJSON(const std::string& text, std::string* error) {
    try {
        return ParseJSON(text);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("JSON parse failed: {}", e.what());
        if (error) *error = e.what();
        return std::nullopt;
    }
}

std::string SerializeJSON(const JSONValue& value, int indent) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value, indent, 0);
    return oss.str();
}

bool JSONEquals(const JSONValue& a, const JSONValue& b) {
    if (a.isNumber() && b.isNumber()) {
        if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value)) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        return numberOf(a).value() == numberOf(b).value();
    }
    if (a.value.index() != b.value.index()) return false;
    if (a.isArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (size_t k = 0; k < x.size(); ++k) {
            const JSONValue nullValue;
            if (!JSONEquals(x[k] ? *x[k] : nullValue, y[k] ? *y[k] : nullValue)) return false;
        }
        return true;
    }
    if (a.isObject()) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [key, val] : x) {
            auto it = y.find(key);
            if (it == y.end()) return false;
            const JSONValue nullValue;
            if (!JSONEquals(val ? *val : nullValue, it->second ? *it->second : nullValue)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

const char* TypeName(const JSONValue& value) {
    switch (value.value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2:
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        default: return "object";
    }
}

std::string RenderScalar(const JSONValue& value) {
    if (value.isString()) return std::get<std::string>(value.value);
    return SerializeJSON(value);
}

const JSONValue* FindMember(const JSONValue& value, const std::string& key) {
    if (!value.isObject()) return nullptr;
    const auto& o = std::get<JSONValue::Object>(value.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

JSONValue MakeObject(std::initializer_list<std::pair<std::string, JSONValue>> members) {
    JSONValue::Object o;
    for (const auto& [key, val] : members) {
        o[key] = std::make_shared<JSONValue>(val);
    }
    return JSONValue(std::move(o));
}

JSONValue MakeArray(std::vector<JSONValue> items) {
    JSONValue::Array a;
    a.reserve(items.size());
    for (auto& v : items) {
        a.push_back(std::make_shared<JSONValue>(std::move(v)));
    }
    return JSONValue(std::move(a));
}

} // namespace dlab
