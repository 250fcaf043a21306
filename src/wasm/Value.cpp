//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements construction, parsing and display helpers for the tagged numeric
// Value.  Parsing is used by the shell when arguments are typed for a function
// call; display formatting is shared by every inspection command.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Value parsing and formatting.

#include "wasm/Value.hpp"

#include <charconv>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace wasmdbg::wasm
{
namespace
{

/// @brief Parse an integer literal into its two's-complement 64-bit pattern.
/// @details Accepts a leading sign and a 0x/0o/0b radix prefix.  The magnitude
///          must fit in 64 unsigned bits; negation wraps.
std::optional<uint64_t> parseIntegerBits(std::string_view text)
{
    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+'))
    {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    int radix = 10;
    if (text.size() > 2 && text[0] == '0')
    {
        switch (text[1])
        {
            case 'x':
            case 'X':
                radix = 16;
                break;
            case 'o':
            case 'O':
                radix = 8;
                break;
            case 'b':
            case 'B':
                radix = 2;
                break;
            default:
                break;
        }
        if (radix != 10)
            text.remove_prefix(2);
    }
    if (text.empty())
        return std::nullopt;

    uint64_t magnitude = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, magnitude, radix);
    if (ec != std::errc{} || ptr != last)
        return std::nullopt;
    return negative ? (~magnitude + 1U) : magnitude;
}

template <typename T, T (*Convert)(const char *, char **)>
std::optional<T> parseFloating(std::string_view text)
{
    if (text.empty())
        return std::nullopt;
    std::string buffer(text);
    char *end = nullptr;
    T parsed = Convert(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size())
        return std::nullopt;
    return parsed;
}

float toFloat32(const char *text, char **end)
{
    return std::strtof(text, end);
}

double toFloat64(const char *text, char **end)
{
    return std::strtod(text, end);
}

} // namespace

std::string_view toString(ValueType type) noexcept
{
    switch (type)
    {
        case ValueType::I32:
            return "i32";
        case ValueType::I64:
            return "i64";
        case ValueType::F32:
            return "f32";
        case ValueType::F64:
            return "f64";
    }
    return "?";
}

Value Value::defaultFor(ValueType type)
{
    switch (type)
    {
        case ValueType::I32:
            return Value(int32_t{0});
        case ValueType::I64:
            return Value(int64_t{0});
        case ValueType::F32:
            return Value(F32{});
        case ValueType::F64:
            return Value(F64{});
    }
    return Value();
}

ValueType Value::type() const noexcept
{
    switch (data_.index())
    {
        case 0:
            return ValueType::I32;
        case 1:
            return ValueType::I64;
        case 2:
            return ValueType::F32;
        default:
            return ValueType::F64;
    }
}

/// @brief Parse a literal typed by the caller.
///
/// @details Integer parsing follows the shell's permissive rules: the literal
///          may be signed or unsigned, and only the low bits of the requested
///          width are kept, so "0xffffffff" and "-1" name the same i32.  Float
///          parsing delegates to the C library so "nan", "inf" and hexadecimal
///          float spellings are accepted.
///
/// @param text Literal text without surrounding whitespace.
/// @param type Kind of value to produce.
/// @return Parsed value or std::nullopt when @p text is not a valid literal.
std::optional<Value> Value::parse(std::string_view text, ValueType type)
{
    switch (type)
    {
        case ValueType::I32:
        {
            auto bits = parseIntegerBits(text);
            if (!bits)
                return std::nullopt;
            return Value(static_cast<uint32_t>(*bits));
        }
        case ValueType::I64:
        {
            auto bits = parseIntegerBits(text);
            if (!bits)
                return std::nullopt;
            return Value(*bits);
        }
        case ValueType::F32:
        {
            auto parsed = parseFloating<float, toFloat32>(text);
            if (!parsed)
                return std::nullopt;
            return Value(*parsed);
        }
        case ValueType::F64:
        {
            auto parsed = parseFloating<double, toFloat64>(text);
            if (!parsed)
                return std::nullopt;
            return Value(*parsed);
        }
    }
    return std::nullopt;
}

/// @brief Render a value with its kind, raw bits and numeric interpretation.
///
/// @details Integers print their hexadecimal pattern followed by the unsigned
///          interpretation and, when the sign bit is set, the signed one as
///          well.  Floats print their bit pattern and an approximate decimal.
std::string toString(const Value &value)
{
    std::ostringstream os;
    switch (value.type())
    {
        case ValueType::I32:
        {
            const int32_t v = *value.as<int32_t>();
            const uint32_t u = static_cast<uint32_t>(v);
            os << "i32 : 0x" << std::hex << std::setw(8) << std::setfill('0') << u << std::dec
               << " = " << u;
            if (v < 0)
                os << " = " << v;
            break;
        }
        case ValueType::I64:
        {
            const int64_t v = *value.as<int64_t>();
            const uint64_t u = static_cast<uint64_t>(v);
            os << "i64 : 0x" << std::hex << std::setw(16) << std::setfill('0') << u << std::dec
               << " = " << u;
            if (v < 0)
                os << " = " << v;
            break;
        }
        case ValueType::F32:
        {
            const F32 v = *value.as<F32>();
            os << "f32 : 0x" << std::hex << std::setw(8) << std::setfill('0') << v.bits
               << std::dec << " ~ " << std::fixed << std::setprecision(8) << v.toFloat();
            break;
        }
        case ValueType::F64:
        {
            const F64 v = *value.as<F64>();
            os << "f64 : 0x" << std::hex << std::setw(16) << std::setfill('0') << v.bits
               << std::dec << " ~ " << std::fixed << std::setprecision(16) << v.toFloat();
            break;
        }
    }
    return os.str();
}

} // namespace wasmdbg::wasm
