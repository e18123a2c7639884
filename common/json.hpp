#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace pqoidc {

class JsonError : public std::invalid_argument {
public:
    explicit JsonError(const std::string &msg) : std::invalid_argument(msg) {}
};

// Scalar JSON value. Claims, certificates and daemon requests are flat
// objects, so nested arrays and objects are not representable.
class JsonValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        String
    };

    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool b) : type_(Type::Bool), bool_(b) {}
    JsonValue(int v) : type_(Type::Int), int_(v) {}
    JsonValue(std::int64_t v) : type_(Type::Int), int_(v) {}
    JsonValue(const char *s) : type_(Type::String), str_(s) {}
    JsonValue(std::string s) : type_(Type::String), str_(std::move(s)) {}

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_int() const { return type_ == Type::Int; }
    bool is_string() const { return type_ == Type::String; }

    // Throw JsonError on a type mismatch.
    bool as_bool() const;
    std::int64_t as_int() const;
    const std::string &as_string() const;

    bool operator==(const JsonValue &other) const;
    bool operator!=(const JsonValue &other) const { return !(*this == other); }

private:
    Type type_{Type::Null};
    bool bool_{false};
    std::int64_t int_{0};
    std::string str_;
};

// Keys are kept sorted, which makes json_encode canonical.
using JsonObject = std::map<std::string, JsonValue>;

std::string json_quote(const std::string &s);
std::string json_encode(const JsonValue &value);
std::string json_encode(const JsonObject &object);

// Parses a single flat object. Rejects nested values, non-integer numbers,
// duplicate keys and trailing content.
JsonObject json_decode_object(const std::string &text);

std::optional<std::string> json_get_string(const JsonObject &object, const std::string &key);
std::optional<std::int64_t> json_get_int(const JsonObject &object, const std::string &key);

} // namespace pqoidc
