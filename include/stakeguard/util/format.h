// STAKEGUARD - String and Amount Formatting
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#ifndef STAKEGUARD_UTIL_FORMAT_H
#define STAKEGUARD_UTIL_FORMAT_H

#include <optional>
#include <string>

namespace stakeguard {
namespace util {

/// Decimal places the wallet accepts for an amount argument
constexpr int AMOUNT_ARG_DECIMALS = 9;

/// Strip leading and trailing whitespace
std::string Trim(const std::string& str);

/// Remove ANSI escape sequences (colour codes, cursor movement)
std::string StripAnsi(const std::string& text);

/**
 * Display an amount truncated (not rounded) to `places` decimals, dropping
 * a fractional part that truncates to nothing: 12.345678 -> "12.3456",
 * 5.0 -> "5".
 */
std::string FormatAmount(double value, int places = 4);

/// Render an amount for a wallet command argument: truncated to
/// AMOUNT_ARG_DECIMALS, no exponent, no trailing zeros.
std::string FormatAmountArg(double value);

/// Parse a plain decimal number occupying the whole string (after trimming)
std::optional<double> ParseDecimal(const std::string& str);

} // namespace util
} // namespace stakeguard

#endif // STAKEGUARD_UTIL_FORMAT_H
