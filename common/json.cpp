#include "json.hpp"

#include <cstdio>
#include <limits>

namespace pqoidc {

bool JsonValue::as_bool() const {
    if (type_ != Type::Bool) {
        throw JsonError("JSON value is not a boolean");
    }
    return bool_;
}

std::int64_t JsonValue::as_int() const {
    if (type_ != Type::Int) {
        throw JsonError("JSON value is not an integer");
    }
    return int_;
}

const std::string &JsonValue::as_string() const {
    if (type_ != Type::String) {
        throw JsonError("JSON value is not a string");
    }
    return str_;
}

bool JsonValue::operator==(const JsonValue &other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
    case Type::Null: return true;
    case Type::Bool: return bool_ == other.bool_;
    case Type::Int: return int_ == other.int_;
    case Type::String: return str_ == other.str_;
    }
    return false;
}

std::string json_quote(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out.push_back(ch);
            }
        }
    }
    out.push_back('"');
    return out;
}

std::string json_encode(const JsonValue &value) {
    switch (value.type()) {
    case JsonValue::Type::Null: return "null";
    case JsonValue::Type::Bool: return value.as_bool() ? "true" : "false";
    case JsonValue::Type::Int: return std::to_string(value.as_int());
    case JsonValue::Type::String: return json_quote(value.as_string());
    }
    return "null";
}

std::string json_encode(const JsonObject &object) {
    std::string out = "{";
    bool first = true;
    for (const auto &kv : object) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        out += json_quote(kv.first);
        out.push_back(':');
        out += json_encode(kv.second);
    }
    out.push_back('}');
    return out;
}

namespace {

class Parser {
public:
    explicit Parser(const std::string &text) : text_(text) {}

    JsonObject parse_object() {
        JsonObject out;
        skip_ws();
        expect('{');
        skip_ws();
        if (peek() == '}') {
            ++pos_;
        } else {
            while (true) {
                skip_ws();
                std::string key = parse_string();
                skip_ws();
                expect(':');
                skip_ws();
                JsonValue value = parse_value();
                if (!out.emplace(std::move(key), std::move(value)).second) {
                    throw JsonError("duplicate JSON key");
                }
                skip_ws();
                char c = next();
                if (c == '}') break;
                if (c != ',') throw JsonError("expected ',' or '}' in JSON object");
            }
        }
        skip_ws();
        if (pos_ != text_.size()) {
            throw JsonError("trailing characters after JSON object");
        }
        return out;
    }

private:
    char peek() const {
        if (pos_ >= text_.size()) throw JsonError("unexpected end of JSON");
        return text_[pos_];
    }

    char next() {
        char c = peek();
        ++pos_;
        return c;
    }

    void expect(char c) {
        if (next() != c) {
            throw JsonError(std::string("expected '") + c + "' in JSON");
        }
    }

    void skip_ws() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    void expect_literal(const char *lit) {
        for (const char *p = lit; *p; ++p) {
            if (next() != *p) throw JsonError("invalid JSON literal");
        }
    }

    JsonValue parse_value() {
        char c = peek();
        if (c == '"') return JsonValue(parse_string());
        if (c == 't') { expect_literal("true"); return JsonValue(true); }
        if (c == 'f') { expect_literal("false"); return JsonValue(false); }
        if (c == 'n') { expect_literal("null"); return JsonValue(); }
        if (c == '-' || (c >= '0' && c <= '9')) return JsonValue(parse_int());
        if (c == '{' || c == '[') throw JsonError("nested JSON values are not supported");
        throw JsonError("invalid JSON value");
    }

    std::int64_t parse_int() {
        bool negative = false;
        if (peek() == '-') {
            negative = true;
            ++pos_;
        }
        if (peek() < '0' || peek() > '9') throw JsonError("invalid JSON number");
        if (peek() == '0' && pos_ + 1 < text_.size() &&
            text_[pos_ + 1] >= '0' && text_[pos_ + 1] <= '9') {
            throw JsonError("leading zeros in JSON number");
        }

        // Accumulate as a negative value so INT64_MIN is representable.
        std::int64_t value = 0;
        const std::int64_t min = std::numeric_limits<std::int64_t>::min();
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            int digit = text_[pos_] - '0';
            if (value < (min + digit) / 10) throw JsonError("JSON integer out of range");
            value = value * 10 - digit;
            ++pos_;
        }
        if (pos_ < text_.size() &&
            (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            throw JsonError("non-integer JSON numbers are not supported");
        }
        if (!negative) {
            if (value == min) throw JsonError("JSON integer out of range");
            value = -value;
        }
        return value;
    }

    unsigned parse_hex4() {
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = next();
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(10 + c - 'a');
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(10 + c - 'A');
            else throw JsonError("invalid \\u escape in JSON string");
        }
        return v;
    }

    static void append_utf8(std::string &out, unsigned cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (true) {
            char c = next();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) {
                throw JsonError("control character in JSON string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            char e = next();
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
                unsigned cp = parse_hex4();
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    expect('\\');
                    expect('u');
                    unsigned lo = parse_hex4();
                    if (lo < 0xDC00 || lo > 0xDFFF) {
                        throw JsonError("unpaired surrogate in JSON string");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    throw JsonError("unpaired surrogate in JSON string");
                }
                append_utf8(out, cp);
                break;
            }
            default:
                throw JsonError("invalid escape in JSON string");
            }
        }
        return out;
    }

    const std::string &text_;
    std::size_t pos_{0};
};

} // namespace

JsonObject json_decode_object(const std::string &text) {
    return Parser(text).parse_object();
}

std::optional<std::string> json_get_string(const JsonObject &object, const std::string &key) {
    auto it = object.find(key);
    if (it == object.end() || !it->second.is_string()) {
        return std::nullopt;
    }
    return it->second.as_string();
}

std::optional<std::int64_t> json_get_int(const JsonObject &object, const std::string &key) {
    auto it = object.find(key);
    if (it == object.end() || !it->second.is_int()) {
        return std::nullopt;
    }
    return it->second.as_int();
}

} // namespace pqoidc
