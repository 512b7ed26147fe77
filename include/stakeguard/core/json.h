// STAKEGUARD - JSON Value
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Small JSON document model: enough to read the price feed response and
// write the webhook notification payload.

#ifndef STAKEGUARD_CORE_JSON_H
#define STAKEGUARD_CORE_JSON_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stakeguard {
namespace core {

class JSONValue {
public:
    enum class Kind { Null, Bool, Int, Double, String, Array, Object };

    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    JSONValue() = default;
    JSONValue(bool value) : kind_(Kind::Bool), flag_(value) {}
    JSONValue(int value) : kind_(Kind::Int), integer_(value) {}
    JSONValue(int64_t value) : kind_(Kind::Int), integer_(value) {}
    JSONValue(double value) : kind_(Kind::Double), real_(value) {}
    JSONValue(const char* value) : kind_(Kind::String), text_(value) {}
    JSONValue(std::string value) : kind_(Kind::String), text_(std::move(value)) {}
    JSONValue(Array value) : kind_(Kind::Array), items_(std::move(value)) {}
    JSONValue(Object value) : kind_(Kind::Object), members_(std::move(value)) {}

    bool IsNull() const { return kind_ == Kind::Null; }
    bool IsNumber() const { return kind_ == Kind::Int || kind_ == Kind::Double; }
    bool IsArray() const { return kind_ == Kind::Array; }
    bool IsObject() const { return kind_ == Kind::Object; }

    /// Typed reads fall back to the default on a kind mismatch
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString() const;

    /// Lookups on a missing key or index yield a shared null value
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);
    const JSONValue& operator[](size_t index) const;

    /// Element count for arrays and objects, 0 otherwise
    size_t Size() const;
    void Push(JSONValue value);

    /// Compact form, object keys in sorted order
    std::string ToJSON() const;

    /// nullopt on any syntax error or trailing data
    static std::optional<JSONValue> TryParse(const std::string& json);

private:
    Kind kind_{Kind::Null};
    bool flag_{false};
    int64_t integer_{0};
    double real_{0.0};
    std::string text_;
    Array items_;
    Object members_;

    static const JSONValue null_;
    static const std::string empty_;
};

} // namespace core
} // namespace stakeguard

#endif // STAKEGUARD_CORE_JSON_H
