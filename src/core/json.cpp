// STAKEGUARD - JSON Value Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/core/json.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace stakeguard {
namespace core {

const JSONValue JSONValue::null_;
const std::string JSONValue::empty_;

// ============================================================================
// Accessors
// ============================================================================

bool JSONValue::GetBool(bool defaultValue) const {
    return kind_ == Kind::Bool ? flag_ : defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    switch (kind_) {
        case Kind::Int:    return integer_;
        case Kind::Double: return static_cast<int64_t>(real_);
        default:           return defaultValue;
    }
}

double JSONValue::GetDouble(double defaultValue) const {
    switch (kind_) {
        case Kind::Double: return real_;
        case Kind::Int:    return static_cast<double>(integer_);
        default:           return defaultValue;
    }
}

const std::string& JSONValue::GetString() const {
    return kind_ == Kind::String ? text_ : empty_;
}

bool JSONValue::HasKey(const std::string& key) const {
    return kind_ == Kind::Object && members_.find(key) != members_.end();
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (kind_ == Kind::Object) {
        auto it = members_.find(key);
        if (it != members_.end()) {
            return it->second;
        }
    }
    return null_;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    // Writing a member turns any other value into an object
    if (kind_ != Kind::Object) {
        *this = JSONValue(Object{});
    }
    return members_[key];
}

size_t JSONValue::Size() const {
    switch (kind_) {
        case Kind::Array:  return items_.size();
        case Kind::Object: return members_.size();
        default:           return 0;
    }
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (kind_ == Kind::Array && index < items_.size()) {
        return items_[index];
    }
    return null_;
}

void JSONValue::Push(JSONValue value) {
    if (kind_ != Kind::Array) {
        *this = JSONValue(Array{});
    }
    items_.push_back(std::move(value));
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

void AppendQuoted(std::string& out, const std::string& text) {
    out += '"';
    for (unsigned char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
}

} // namespace

std::string JSONValue::ToJSON() const {
    std::string out;
    switch (kind_) {
        case Kind::Null:
            out = "null";
            break;
        case Kind::Bool:
            out = flag_ ? "true" : "false";
            break;
        case Kind::Int:
            out = std::to_string(integer_);
            break;
        case Kind::Double: {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.15g", real_);
            out = buf;
            break;
        }
        case Kind::String:
            AppendQuoted(out, text_);
            break;
        case Kind::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : items_) {
                if (!first) out += ',';
                first = false;
                out += item.ToJSON();
            }
            out += ']';
            break;
        }
        case Kind::Object: {
            out += '{';
            bool first = true;
            for (const auto& member : members_) {
                if (!first) out += ',';
                first = false;
                AppendQuoted(out, member.first);
                out += ':';
                out += member.second.ToJSON();
            }
            out += '}';
            break;
        }
    }
    return out;
}

// ============================================================================
// Parsing
// ============================================================================

namespace {

/// Recursive-descent reader over one document. Every Read* leaves the
/// cursor just past what it consumed and returns nullopt on malformed input.
class Reader {
public:
    using Array = JSONValue::Array;
    using Object = JSONValue::Object;

    explicit Reader(const std::string& text) : text_(text) {}

    std::optional<JSONValue> ReadDocument() {
        auto value = ReadValue(0);
        SkipSpace();
        if (!value || pos_ != text_.size()) {
            return std::nullopt;
        }
        return value;
    }

private:
    static constexpr int MAX_DEPTH = 64;

    bool AtEnd() const { return pos_ >= text_.size(); }
    char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }

    void SkipSpace() {
        while (!AtEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool Consume(char expected) {
        SkipSpace();
        if (Peek() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    bool ConsumeWord(const char* word, size_t len) {
        if (text_.compare(pos_, len, word) != 0) {
            return false;
        }
        pos_ += len;
        return true;
    }

    std::optional<JSONValue> ReadValue(int depth) {
        if (depth > MAX_DEPTH) {
            return std::nullopt;
        }
        SkipSpace();
        char c = Peek();
        if (c == '{') return ReadObject(depth);
        if (c == '[') return ReadArray(depth);
        if (c == '"') {
            auto text = ReadString();
            if (!text) return std::nullopt;
            return JSONValue(std::move(*text));
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return ReadNumber();
        if (ConsumeWord("true", 4)) return JSONValue(true);
        if (ConsumeWord("false", 5)) return JSONValue(false);
        if (ConsumeWord("null", 4)) return JSONValue();
        return std::nullopt;
    }

    std::optional<JSONValue> ReadObject(int depth) {
        ++pos_;
        Object members;
        if (Consume('}')) {
            return JSONValue(std::move(members));
        }
        do {
            SkipSpace();
            auto key = ReadString();
            if (!key || !Consume(':')) return std::nullopt;
            auto value = ReadValue(depth + 1);
            if (!value) return std::nullopt;
            members[*key] = std::move(*value);
        } while (Consume(','));

        if (!Consume('}')) return std::nullopt;
        return JSONValue(std::move(members));
    }

    std::optional<JSONValue> ReadArray(int depth) {
        ++pos_;
        Array items;
        if (Consume(']')) {
            return JSONValue(std::move(items));
        }
        do {
            auto value = ReadValue(depth + 1);
            if (!value) return std::nullopt;
            items.push_back(std::move(*value));
        } while (Consume(','));

        if (!Consume(']')) return std::nullopt;
        return JSONValue(std::move(items));
    }

    std::optional<std::string> ReadString() {
        if (Peek() != '"') return std::nullopt;
        ++pos_;

        std::string out;
        while (!AtEnd()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (AtEnd()) return std::nullopt;
            char esc = text_[pos_++];
            switch (esc) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'u':
                    if (!ReadCodepoint(out)) return std::nullopt;
                    break;
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;  // Unterminated
    }

    bool ReadHex4(uint32_t& value) {
        if (pos_ + 4 > text_.size()) return false;
        value = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<uint32_t>(h - 'A' + 10);
            else return false;
        }
        return true;
    }

    /// \uXXXX (with surrogate pairs) appended as UTF-8
    bool ReadCodepoint(std::string& out) {
        uint32_t cp = 0;
        if (!ReadHex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            uint32_t low = 0;
            if (!ConsumeWord("\\u", 2) || !ReadHex4(low) || low < 0xDC00 || low > 0xDFFF) {
                return false;
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }

        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        return true;
    }

    std::optional<JSONValue> ReadNumber() {
        size_t start = pos_;
        bool integral = true;
        auto digits = [this] {
            size_t before = pos_;
            while (!AtEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            return pos_ > before;
        };

        if (Peek() == '-') ++pos_;
        if (!digits()) return std::nullopt;
        if (Peek() == '.') {
            integral = false;
            ++pos_;
            if (!digits()) return std::nullopt;
        }
        if (Peek() == 'e' || Peek() == 'E') {
            integral = false;
            ++pos_;
            if (Peek() == '+' || Peek() == '-') ++pos_;
            if (!digits()) return std::nullopt;
        }

        std::string literal = text_.substr(start, pos_ - start);
        if (integral) {
            errno = 0;
            long long v = std::strtoll(literal.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: fall through to double
        }
        return JSONValue(std::strtod(literal.c_str(), nullptr));
    }

    const std::string& text_;
    size_t pos_{0};
};

} // namespace

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    return Reader(json).ReadDocument();
}

} // namespace core
} // namespace stakeguard
