//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: JSON parser, serializer and JSON-RPC message (de)serialization using only std library
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <format>
#include <sstream>
#include <stdexcept>
#include <iomanip>
#include "lsp/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace lsp {

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
constexpr unsigned int kMaxDepth = 512u;

void appendUtf8(std::string& out, unsigned int code) {
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

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

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

    bool atEnd() {
        skipWs();
        return i >= s.size();
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) throw std::runtime_error("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else throw std::runtime_error("Invalid hex in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') throw std::runtime_error("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) throw std::runtime_error("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
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
                        // Combine UTF-16 surrogate pairs; a lone surrogate becomes U+FFFD
                        if (code >= 0xD800 && code <= 0xDBFF) {
                            if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                                i += 2;
                                unsigned int low = parseHex4();
                                if (low >= 0xDC00 && low <= 0xDFFF) {
                                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                                } else {
                                    appendUtf8(out, 0xFFFD);
                                    code = low;
                                }
                            } else {
                                code = 0xFFFD;
                            }
                        } else if (code >= 0xDC00 && code <= 0xDFFF) {
                            code = 0xFFFD;
                        }
                        appendUtf8(out, code);
                        break;
                    }
                    default: throw std::runtime_error("Unknown escape");
                }
            } else if (static_cast<unsigned char>(c) < 0x20) {
                throw std::runtime_error("Control character in string");
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) throw std::runtime_error("Invalid JSON value");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) throw std::runtime_error("Invalid number fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) throw std::runtime_error("Invalid number exponent");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                long long v = std::stoll(num);
                return JSONValue(static_cast<int64_t>(v));
            } catch (const std::out_of_range&) {
                // Fall through: integers beyond int64 degrade to double
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Number out of range: " + num);
        }
    }

    JSONValue parseArray() {
        if (!match('[')) throw std::runtime_error("Expected '['");
        if (++depth > kMaxDepth) throw std::runtime_error("JSON nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) throw std::runtime_error("Expected '{'");
        if (++depth > kMaxDepth) throw std::runtime_error("JSON nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) throw std::runtime_error("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
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
            throw std::runtime_error("Invalid literal");
        }
        if (c == 'f') { // false
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
            throw std::runtime_error("Invalid literal");
        }
        if (c == 'n') { // null
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
            throw std::runtime_error("Invalid literal");
        }
        return parseNumber();
    }
};

void writeEscapedString(std::ostringstream& oss, const std::string& v) {
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

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                oss << "null";
            } else {
                // Shortest round-trip representation; keep a fraction marker so the value re-parses as double
                std::string num = std::format("{}", v);
                if (num.find_first_of(".eE") == std::string::npos) {
                    num += ".0";
                }
                oss << num;
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscapedString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) { writeValue(oss, *v[k]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscapedString(oss, key);
                oss << ':';
                if (val) { writeValue(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    if (!p.atEnd()) {
        throw std::runtime_error(std::format("Unexpected trailing data at offset {}", p.i));
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

bool JSONEquals(const JSONValue& a, const JSONValue& b) {
    const bool aNum = std::holds_alternative<int64_t>(a.value) || std::holds_alternative<double>(a.value);
    const bool bNum = std::holds_alternative<int64_t>(b.value) || std::holds_alternative<double>(b.value);
    if (aNum && bNum) {
        if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value)) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        auto asDouble = [](const JSONValue& v) {
            return std::holds_alternative<int64_t>(v.value)
                ? static_cast<double>(std::get<int64_t>(v.value)) : std::get<double>(v.value);
        };
        return asDouble(a) == asDouble(b);
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (a.isArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (std::size_t k = 0; k < x.size(); ++k) {
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

JSONValue MakeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [key, val] : members) {
        obj[key] = std::make_shared<JSONValue>(val);
    }
    return JSONValue(std::move(obj));
}

JSONValue MakeArray(std::vector<JSONValue> items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(std::move(item)));
    }
    return JSONValue(std::move(arr));
}

const JSONValue* FindMember(const JSONValue& object, const std::string& key) {
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

std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v == nullptr || !v->isString()) {
        return std::nullopt;
    }
    return std::get<std::string>(v->value);
}

std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    if (std::holds_alternative<double>(v->value)) {
        const double d = std::get<double>(v->value);
        if (std::isfinite(d) && d == std::floor(d)) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

void SetMember(JSONValue& object, const std::string& key, JSONValue member) {
    if (!object.isObject()) {
        object.value = JSONValue::Object{};
    }
    std::get<JSONValue::Object>(object.value)[key] = std::make_shared<JSONValue>(std::move(member));
}

JSONValue IdToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return JSONValue(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return JSONValue(v);
        } else {
            return JSONValue(nullptr);
        }
    }, id);
}

std::optional<int64_t> ParseNumericId(const JSONValue& raw) {
    if (std::holds_alternative<int64_t>(raw.value)) {
        return std::get<int64_t>(raw.value);
    }
    if (raw.isString()) {
        const auto& s = std::get<std::string>(raw.value);
        if (s.empty()) {
            return std::nullopt;
        }
        std::size_t consumed = 0;
        try {
            long long v = std::stoll(s, &consumed);
            if (consumed == s.size()) {
                return static_cast<int64_t>(v);
            }
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

namespace {
std::optional<JSONRPCId> idFromJSON(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) return JSONRPCId{std::get<int64_t>(v.value)};
    if (v.isString()) return JSONRPCId{std::get<std::string>(v.value)};
    if (v.isNull()) return JSONRPCId{nullptr};
    return std::nullopt;
}
} // namespace

std::string JSONRPCMessage::Serialize() const {
    return SerializeJSON(ToJSON());
}

bool JSONRPCMessage::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromJSON(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSON-RPC message: {}", e.what());
        return false;
    }
}

// JSONRPCRequest implementation
JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue out = MakeObject({
        {"jsonrpc", JSONValue(jsonrpc)},
        {"id", IdToJSON(id)},
        {"method", JSONValue(method)}
    });
    if (params.has_value()) {
        SetMember(out, "params", params.value());
    }
    return out;
}

bool JSONRPCRequest::FromJSON(const JSONValue& json) {
    auto m = GetStringMember(json, "method");
    const JSONValue* rawId = FindMember(json, "id");
    if (!m.has_value() || m->empty() || rawId == nullptr) {
        return false;
    }
    auto parsedId = idFromJSON(*rawId);
    if (!parsedId.has_value()) {
        return false;
    }
    method = std::move(*m);
    id = std::move(*parsedId);
    if (const JSONValue* p = FindMember(json, "params")) {
        params = *p;
    }
    return true;
}

// JSONRPCResponse implementation
JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue out = MakeObject({
        {"jsonrpc", JSONValue(jsonrpc)},
        {"id", IdToJSON(id)}
    });
    if (error.has_value()) {
        SetMember(out, "error", error.value());
    } else {
        SetMember(out, "result", result.has_value() ? result.value() : JSONValue(nullptr));
    }
    return out;
}

bool JSONRPCResponse::FromJSON(const JSONValue& json) {
    const JSONValue* rawId = FindMember(json, "id");
    const JSONValue* r = FindMember(json, "result");
    const JSONValue* e = FindMember(json, "error");
    if (r == nullptr && e == nullptr) {
        return false;
    }
    if (rawId != nullptr) {
        auto parsedId = idFromJSON(*rawId);
        if (!parsedId.has_value()) {
            return false;
        }
        id = std::move(*parsedId);
    } else {
        id = nullptr;
    }
    if (e != nullptr) {
        error = *e;
    } else {
        result = r != nullptr ? *r : JSONValue(nullptr);
    }
    return true;
}

// JSONRPCNotification implementation
JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue out = MakeObject({
        {"jsonrpc", JSONValue(jsonrpc)},
        {"method", JSONValue(method)}
    });
    if (params.has_value()) {
        SetMember(out, "params", params.value());
    }
    return out;
}

bool JSONRPCNotification::FromJSON(const JSONValue& json) {
    auto m = GetStringMember(json, "method");
    if (!m.has_value() || m->empty()) {
        return false;
    }
    method = std::move(*m);
    if (const JSONValue* p = FindMember(json, "params")) {
        params = *p;
    }
    return true;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    std::unordered_map<std::string, std::shared_ptr<JSONValue>> errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);

    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }

    return JSONValue(errorObj);
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();

    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace lsp
