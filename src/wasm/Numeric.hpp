//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/Numeric.hpp
// Purpose: Fixed-width integer and IEEE-754 helpers implementing WebAssembly
//          numeric semantics for the interpreter.
// Key invariants: Integer arithmetic wraps modulo the width and never invokes
//                 signed-overflow undefined behaviour; only division,
//                 remainder and float-to-int truncation can fail. Sign, abs
//                 and copysign operate on raw bits so NaN payloads survive.
//                 Byte (de)serialisation is always little-endian regardless
//                 of the host.
// Ownership/Lifetime: Header-only, stateless.
// Links: https://webassembly.github.io/spec/core/exec/numerics.html
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/expected.hpp"
#include "wasm/Value.hpp"

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace wasmdbg::wasm
{

/// @brief Failure conditions raised by checked numeric operations.
enum class ArithError : uint8_t
{
    DivisionByZero,    ///< Integer division or remainder by zero.
    SignedOverflow,    ///< Signed division of the minimum value by -1.
    InvalidConversion, ///< Float-to-int truncation of NaN or out-of-range input.
};

namespace numeric
{

template <typename T> using Checked = support::Expected<T, ArithError>;

//===----------------------------------------------------------------------===//
// Integer arithmetic
//===----------------------------------------------------------------------===//

template <typename T> constexpr T wrappingAdd(T lhs, T rhs) noexcept
{
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(lhs) + static_cast<U>(rhs));
}

template <typename T> constexpr T wrappingSub(T lhs, T rhs) noexcept
{
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(lhs) - static_cast<U>(rhs));
}

template <typename T> constexpr T wrappingMul(T lhs, T rhs) noexcept
{
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(lhs) * static_cast<U>(rhs));
}

/// @brief Integer division with trap conditions.
/// @details Unsigned types only fail on a zero divisor; signed types also fail
///          when dividing the minimum value by -1.
template <typename T> Checked<T> div(T lhs, T rhs)
{
    if (rhs == 0)
        return ArithError::DivisionByZero;
    if constexpr (std::is_signed_v<T>)
    {
        if (lhs == std::numeric_limits<T>::min() && rhs == static_cast<T>(-1))
            return ArithError::SignedOverflow;
    }
    return static_cast<T>(lhs / rhs);
}

/// @brief Integer remainder; the signed minimum modulo -1 is zero, not a trap.
template <typename T> Checked<T> rem(T lhs, T rhs)
{
    if (rhs == 0)
        return ArithError::DivisionByZero;
    if constexpr (std::is_signed_v<T>)
    {
        if (rhs == static_cast<T>(-1))
            return static_cast<T>(0);
    }
    return static_cast<T>(lhs % rhs);
}

template <typename T> constexpr unsigned shiftCount(T count) noexcept
{
    return static_cast<unsigned>(count) & (std::numeric_limits<std::make_unsigned_t<T>>::digits - 1);
}

template <typename T> constexpr T shl(T value, T count) noexcept
{
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(value) << shiftCount(count));
}

/// @brief Arithmetic right shift.
template <typename T> constexpr T shrS(T value, T count) noexcept
{
    using S = std::make_signed_t<T>;
    return static_cast<T>(static_cast<S>(value) >> shiftCount(count));
}

/// @brief Logical right shift.
template <typename T> constexpr T shrU(T value, T count) noexcept
{
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(value) >> shiftCount(count));
}

template <typename T> constexpr T rotl(T value, T count) noexcept
{
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(std::rotl(static_cast<U>(value), static_cast<int>(shiftCount(count))));
}

template <typename T> constexpr T rotr(T value, T count) noexcept
{
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(std::rotr(static_cast<U>(value), static_cast<int>(shiftCount(count))));
}

/// @brief Count leading zero bits; returns the width for zero.
template <typename T> constexpr T clz(T value) noexcept
{
    return static_cast<T>(std::countl_zero(static_cast<std::make_unsigned_t<T>>(value)));
}

/// @brief Count trailing zero bits; returns the width for zero.
template <typename T> constexpr T ctz(T value) noexcept
{
    return static_cast<T>(std::countr_zero(static_cast<std::make_unsigned_t<T>>(value)));
}

template <typename T> constexpr T popcnt(T value) noexcept
{
    return static_cast<T>(std::popcount(static_cast<std::make_unsigned_t<T>>(value)));
}

//===----------------------------------------------------------------------===//
// Extension and wrapping
//===----------------------------------------------------------------------===//

/// @brief Widen @p value to @p To, sign- or zero-extending by the source type.
template <typename To, typename From> constexpr To extendTo(From value) noexcept
{
    static_assert(sizeof(To) >= sizeof(From), "extendTo must not narrow");
    return static_cast<To>(value);
}

/// @brief Keep the low bits of @p value that fit in @p To.
template <typename To, typename From> constexpr To wrapTo(From value) noexcept
{
    static_assert(sizeof(To) <= sizeof(From), "wrapTo must not widen");
    return static_cast<To>(static_cast<std::make_unsigned_t<To>>(
        static_cast<std::make_unsigned_t<From>>(value)));
}

/// @brief Sign-extend the low @p Bits of @p value across the full width.
template <typename T, unsigned Bits> constexpr T signExtendLow(T value) noexcept
{
    if constexpr (Bits == 8)
        return static_cast<T>(static_cast<int8_t>(value));
    else if constexpr (Bits == 16)
        return static_cast<T>(static_cast<int16_t>(value));
    else
        return static_cast<T>(static_cast<int32_t>(value));
}

//===----------------------------------------------------------------------===//
// Floating point
//===----------------------------------------------------------------------===//

template <typename F> struct FloatBits;

template <> struct FloatBits<F32>
{
    using Native = float;
    using Raw = uint32_t;
    static constexpr Raw kSignMask = 0x80000000U;
};

template <> struct FloatBits<F64>
{
    using Native = double;
    using Raw = uint64_t;
    static constexpr Raw kSignMask = 0x8000000000000000ULL;
};

template <typename F> constexpr F fabs(F value) noexcept
{
    return F{value.bits & ~FloatBits<F>::kSignMask};
}

template <typename F> constexpr F fneg(F value) noexcept
{
    return F{value.bits ^ FloatBits<F>::kSignMask};
}

template <typename F> constexpr F copysign(F magnitude, F sign) noexcept
{
    constexpr auto mask = FloatBits<F>::kSignMask;
    return F{(magnitude.bits & ~mask) | (sign.bits & mask)};
}

/// @brief WebAssembly min: NaN propagates and -0 orders below +0.
template <typename T> T fmin(T lhs, T rhs) noexcept
{
    if (std::isnan(lhs) || std::isnan(rhs))
        return lhs + rhs;
    if (lhs == rhs)
        return std::signbit(lhs) ? lhs : rhs;
    return lhs < rhs ? lhs : rhs;
}

/// @brief WebAssembly max: NaN propagates and +0 orders above -0.
template <typename T> T fmax(T lhs, T rhs) noexcept
{
    if (std::isnan(lhs) || std::isnan(rhs))
        return lhs + rhs;
    if (lhs == rhs)
        return std::signbit(lhs) ? rhs : lhs;
    return lhs > rhs ? lhs : rhs;
}

/// @brief Round to nearest, ties to even.
template <typename T> T nearest(T value) noexcept
{
    return std::nearbyint(value);
}

/// @brief Truncate a float toward zero into integer type @p Int.
/// @details Fails with InvalidConversion when @p value is NaN or its truncated
///          magnitude does not fit in @p Int.
template <typename Int, typename Float> Checked<Int> truncChecked(Float value)
{
    if (std::isnan(value))
        return ArithError::InvalidConversion;
    const Float truncated = std::trunc(value);
    const Float limit = std::ldexp(Float{1}, std::numeric_limits<Int>::digits);
    const Float lower = std::is_signed_v<Int> ? -limit : Float{0};
    if (!(truncated >= lower && truncated < limit))
        return ArithError::InvalidConversion;
    return static_cast<Int>(truncated);
}

//===----------------------------------------------------------------------===//
// Little-endian (de)serialisation
//===----------------------------------------------------------------------===//

template <typename T> struct RawOf
{
    using type = std::make_unsigned_t<T>;
};

template <> struct RawOf<F32>
{
    using type = uint32_t;
};

template <> struct RawOf<F64>
{
    using type = uint64_t;
};

/// @brief Decode a little-endian @p T from @p bytes (sizeof raw bytes).
template <typename T> T loadLittleEndian(const uint8_t *bytes) noexcept
{
    using Raw = typename RawOf<T>::type;
    Raw raw = 0;
    for (std::size_t i = 0; i < sizeof(Raw); ++i)
        raw |= static_cast<Raw>(static_cast<Raw>(bytes[i]) << (8U * i));
    if constexpr (std::is_same_v<T, F32> || std::is_same_v<T, F64>)
        return T{raw};
    else
        return static_cast<T>(raw);
}

/// @brief Encode @p value little-endian into @p bytes.
template <typename T> void storeLittleEndian(T value, uint8_t *bytes) noexcept
{
    using Raw = typename RawOf<T>::type;
    Raw raw;
    if constexpr (std::is_same_v<T, F32> || std::is_same_v<T, F64>)
        raw = value.bits;
    else
        raw = static_cast<Raw>(value);
    for (std::size_t i = 0; i < sizeof(Raw); ++i)
        bytes[i] = static_cast<uint8_t>(raw >> (8U * i));
}

} // namespace numeric
} // namespace wasmdbg::wasm
