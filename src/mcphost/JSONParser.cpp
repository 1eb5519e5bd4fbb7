//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: JSON parser/serializer and JSON-RPC message conversions using only the std library
//==========================================================================================================

#include <cmath>
#include <cctype>
#include <charconv>
#include <format>
#include <stdexcept>
#include "mcphost/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcphost {

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

const JSONValue* JSONValue::Find(const std::string& key) const {
    const auto* obj = std::get_if<Object>(&value);
    if (!obj) {
        return nullptr;
    }
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::format("JSON parse error at offset {}: {}", i, what));
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
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex in unicode escape");
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
        if (i >= s.size() || s[i] != '"') fail("expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
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
                        // High surrogate must be followed by \uDC00..\uDFFF
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("unpaired low surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        const std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) fail("invalid number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            const std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("invalid fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            const std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("invalid exponent");
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Out of int64 range: keep magnitude as a double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc() || ptr != last) fail("number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        if (++depth > kMaxDepth) fail("nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'");
        if (++depth > kMaxDepth) fail("nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
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
                    out += std::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void serializeInto(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                out += "null";
                return;
            }
            std::string num = std::format("{}", v);
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            out += num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (v[k]) { serializeInto(out, *v[k]); } else { out += "null"; }
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) { serializeInto(out, *val); } else { out += "null"; }
            }
            out.push_back('}');
        }
    }, value.get());
}

bool numericEqual(const JSONValue& a, const JSONValue& b, bool& handled) {
    handled = true;
    const auto* ai = std::get_if<int64_t>(&a.value);
    const auto* ad = std::get_if<double>(&a.value);
    const auto* bi = std::get_if<int64_t>(&b.value);
    const auto* bd = std::get_if<double>(&b.value);
    if (ai && bd) return static_cast<double>(*ai) == *bd;
    if (ad && bi) return *ad == static_cast<double>(*bi);
    handled = false;
    return false;
}
} // namespace

bool operator==(const JSONValue& a, const JSONValue& b) {
    bool handled = false;
    const bool mixed = numericEqual(a, b, handled);
    if (handled) {
        return mixed;
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (const auto* aa = std::get_if<JSONValue::Array>(&a.value)) {
        const auto& ba = std::get<JSONValue::Array>(b.value);
        if (aa->size() != ba.size()) return false;
        for (std::size_t k = 0; k < aa->size(); ++k) {
            const JSONValue nullValue;
            const JSONValue& x = (*aa)[k] ? *(*aa)[k] : nullValue;
            const JSONValue& y = ba[k] ? *ba[k] : nullValue;
            if (!(x == y)) return false;
        }
        return true;
    }
    if (const auto* ao = std::get_if<JSONValue::Object>(&a.value)) {
        const auto& bo = std::get<JSONValue::Object>(b.value);
        if (ao->size() != bo.size()) return false;
        for (const auto& [key, val] : *ao) {
            auto it = bo.find(key);
            if (it == bo.end()) return false;
            const JSONValue nullValue;
            const JSONValue& x = val ? *val : nullValue;
            const JSONValue& y = it->second ? *it->second : nullValue;
            if (!(x == y)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::string out;
    serializeInto(out, value);
    return out;
}

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("trailing characters after JSON value");
    }
    return v;
}

JSONValue MakeObject(std::initializer_list<std::pair<std::string, JSONValue>> members) {
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

void SetMember(JSONValue& object, const std::string& key, JSONValue member) {
    if (!object.IsObject()) {
        object.value = JSONValue::Object{};
    }
    std::get<JSONValue::Object>(object.value)[key] = std::make_shared<JSONValue>(std::move(member));
}

std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = object.Find(key);
    if (!v || !v->IsString()) {
        return std::nullopt;
    }
    return std::get<std::string>(v->value);
}

std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = object.Find(key);
    if (!v) {
        return std::nullopt;
    }
    if (const auto* iv = std::get_if<int64_t>(&v->value)) {
        return *iv;
    }
    if (const auto* dv = std::get_if<double>(&v->value)) {
        if (std::isfinite(*dv) && std::floor(*dv) == *dv) {
            return static_cast<int64_t>(*dv);
        }
    }
    return std::nullopt;
}

const JSONValue::Array* GetArrayMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = object.Find(key);
    if (!v) {
        return nullptr;
    }
    return std::get_if<JSONValue::Array>(&v->value);
}

JSONValue IdToValue(const JSONRPCId& id) {
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

std::string IdToString(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else {
            return std::string("null");
        }
    }, id);
}

namespace {
bool idFromValue(const JSONValue* v, JSONRPCId& out) {
    if (!v || v->IsNull()) {
        out = nullptr;
        return true;
    }
    if (const auto* s = std::get_if<std::string>(&v->value)) {
        out = *s;
        return true;
    }
    if (const auto* n = std::get_if<int64_t>(&v->value)) {
        out = *n;
        return true;
    }
    if (const auto* d = std::get_if<double>(&v->value)) {
        // Some servers echo integer ids as 1.0
        if (std::isfinite(*d) && std::floor(*d) == *d) {
            out = static_cast<int64_t>(*d);
            return true;
        }
    }
    return false;
}
} // namespace

//----------------------------------------------------------------------------------------------------------
// JSONRPCMessage
//----------------------------------------------------------------------------------------------------------
std::string JSONRPCMessage::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToValue());
}

bool JSONRPCMessage::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_DEBUG("JSONRPCMessage: failed to deserialize: {}", e.what());
        return false;
    }
}

//----------------------------------------------------------------------------------------------------------
// JSONRPCRequest
//----------------------------------------------------------------------------------------------------------
JSONValue JSONRPCRequest::ToValue() const {
    JSONValue v = MakeObject({
        {"jsonrpc", JSONValue(jsonrpc)},
        {"id", IdToValue(id)},
        {"method", JSONValue(method)}
    });
    if (params.has_value()) {
        SetMember(v, "params", params.value());
    }
    return v;
}

bool JSONRPCRequest::FromValue(const JSONValue& v) {
    auto m = GetStringMember(v, "method");
    if (!m || !v.Find("id")) {
        return false;
    }
    if (!idFromValue(v.Find("id"), id)) {
        return false;
    }
    method = *m;
    if (const JSONValue* p = v.Find("params")) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------
// JSONRPCResponse
//----------------------------------------------------------------------------------------------------------
JSONValue JSONRPCResponse::ToValue() const {
    JSONValue v = MakeObject({
        {"jsonrpc", JSONValue(jsonrpc)},
        {"id", IdToValue(id)}
    });
    if (error.has_value()) {
        SetMember(v, "error", error.value());
    } else {
        SetMember(v, "result", result.has_value() ? result.value() : JSONValue(nullptr));
    }
    return v;
}

bool JSONRPCResponse::FromValue(const JSONValue& v) {
    if (!v.IsObject() || v.Find("method")) {
        return false;
    }
    const JSONValue* r = v.Find("result");
    const JSONValue* e = v.Find("error");
    if (!r && !e) {
        return false;
    }
    if (!idFromValue(v.Find("id"), id)) {
        return false;
    }
    result.reset();
    error.reset();
    if (e && !e->IsNull()) {
        error = *e;
    } else if (r) {
        result = *r;
    } else {
        result = JSONValue(nullptr);
    }
    return true;
}

int64_t JSONRPCResponse::ErrorCode() const {
    if (!error.has_value()) {
        return 0;
    }
    return GetIntMember(error.value(), "code").value_or(0);
}

std::string JSONRPCResponse::ErrorMessage() const {
    if (!error.has_value()) {
        return std::string();
    }
    if (error->IsString()) {
        return std::get<std::string>(error->value);
    }
    return GetStringMember(error.value(), "message").value_or(SerializeJSON(error.value()));
}

//----------------------------------------------------------------------------------------------------------
// JSONRPCNotification
//----------------------------------------------------------------------------------------------------------
JSONValue JSONRPCNotification::ToValue() const {
    JSONValue v = MakeObject({
        {"jsonrpc", JSONValue(jsonrpc)},
        {"method", JSONValue(method)}
    });
    if (params.has_value()) {
        SetMember(v, "params", params.value());
    }
    return v;
}

bool JSONRPCNotification::FromValue(const JSONValue& v) {
    auto m = GetStringMember(v, "method");
    if (!m || v.Find("id")) {
        return false;
    }
    method = *m;
    if (const JSONValue* p = v.Find("params")) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

JSONValue CreateErrorObject(int code, const std::string& message, const std::optional<JSONValue>& data) {
    JSONValue v = MakeObject({
        {"code", JSONValue(static_cast<int64_t>(code))},
        {"message", JSONValue(message)}
    });
    if (data.has_value()) {
        SetMember(v, "data", data.value());
    }
    return v;
}

} // namespace mcphost
