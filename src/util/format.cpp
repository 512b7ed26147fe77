// STAKEGUARD - String and Amount Formatting Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/util/format.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace stakeguard {
namespace util {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string StripAnsi(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '\x1B') {
            result += text[i++];
            continue;
        }

        ++i;
        if (i >= text.size()) {
            break;
        }

        if (text[i] == '[') {
            // CSI: parameter and intermediate bytes, then one final byte
            ++i;
            while (i < text.size() && (text[i] < 0x40 || text[i] > 0x7E)) {
                ++i;
            }
            if (i < text.size()) {
                ++i;
            }
        } else {
            // Two-byte escape
            ++i;
        }
    }

    return result;
}

static std::string TruncateDecimal(double value, int places) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(12) << value;
    std::string text = oss.str();

    size_t dot = text.find('.');
    if (dot == std::string::npos) {
        return text;
    }

    std::string fraction = text.substr(dot + 1, static_cast<size_t>(places));
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }

    std::string whole = text.substr(0, dot);
    if (fraction.empty()) {
        if (whole == "-0") {
            whole = "0";
        }
        return whole;
    }
    return whole + "." + fraction;
}

std::string FormatAmount(double value, int places) {
    return TruncateDecimal(value, places);
}

std::string FormatAmountArg(double value) {
    return TruncateDecimal(value, AMOUNT_ARG_DECIMALS);
}

std::optional<double> ParseDecimal(const std::string& str) {
    std::string text = Trim(str);
    if (text.empty()) {
        return std::nullopt;
    }

    size_t i = 0;
    if (text[0] == '-' || text[0] == '+') {
        ++i;
    }

    bool sawDigit = false;
    bool sawDot = false;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            sawDigit = true;
        } else if (c == '.' && !sawDot) {
            sawDot = true;
        } else {
            return std::nullopt;
        }
    }

    if (!sawDigit) {
        return std::nullopt;
    }

    try {
        return std::stod(text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace util
} // namespace stakeguard
