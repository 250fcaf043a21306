//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/Value.hpp
// Purpose: Tagged numeric value used by the interpreter, the module
//          representation and the debugger front ends.
// Key invariants: A Value holds exactly one of i32, i64, f32, f64. Float
//                 payloads are stored as raw bit patterns so NaN payloads and
//                 signed zeros survive every copy and comparison.
// Ownership/Lifetime: Plain value type.
// Links: https://webassembly.github.io/spec/core/exec/numerics.html
//
//===----------------------------------------------------------------------===//

#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace wasmdbg::wasm
{

/// @brief Numeric value kinds understood by the interpreter.
enum class ValueType : uint8_t
{
    I32 = 0x7F,
    I64 = 0x7E,
    F32 = 0x7D,
    F64 = 0x7C,
};

/// @brief Stable lowercase mnemonic for @p type ("i32", "f64", ...).
std::string_view toString(ValueType type) noexcept;

/// @brief Bit-exact single precision float.
/// @details Equality compares bit patterns, not IEEE values: NaN == NaN when
///          the payloads match and +0 != -0.
struct F32
{
    uint32_t bits = 0;

    static F32 fromFloat(float value) noexcept
    {
        return F32{std::bit_cast<uint32_t>(value)};
    }

    static constexpr F32 fromBits(uint32_t raw) noexcept
    {
        return F32{raw};
    }

    float toFloat() const noexcept
    {
        return std::bit_cast<float>(bits);
    }

    friend constexpr bool operator==(F32 lhs, F32 rhs) noexcept
    {
        return lhs.bits == rhs.bits;
    }
};

/// @brief Bit-exact double precision float.
struct F64
{
    uint64_t bits = 0;

    static F64 fromFloat(double value) noexcept
    {
        return F64{std::bit_cast<uint64_t>(value)};
    }

    static constexpr F64 fromBits(uint64_t raw) noexcept
    {
        return F64{raw};
    }

    double toFloat() const noexcept
    {
        return std::bit_cast<double>(bits);
    }

    friend constexpr bool operator==(F64 lhs, F64 rhs) noexcept
    {
        return lhs.bits == rhs.bits;
    }
};

/// @brief Tagged union of the four numeric kinds.
class Value
{
  public:
    /// @brief Default value is i32 zero.
    Value() = default;

    Value(int32_t v) : data_(v) {}

    Value(uint32_t v) : data_(static_cast<int32_t>(v)) {}

    Value(int64_t v) : data_(v) {}

    Value(uint64_t v) : data_(static_cast<int64_t>(v)) {}

    Value(F32 v) : data_(v) {}

    Value(F64 v) : data_(v) {}

    Value(float v) : data_(F32::fromFloat(v)) {}

    Value(double v) : data_(F64::fromFloat(v)) {}

    /// @brief Zero of the requested kind.
    static Value defaultFor(ValueType type);

    /// @brief Kind of the stored payload.
    ValueType type() const noexcept;

    /// @brief Read the payload as @p T when the stored kind matches.
    /// @details Integer views accept both signednesses of the matching width;
    ///          float views accept the native float or the bit wrapper. No
    ///          coercion between kinds is ever performed.
    /// @return The payload, or std::nullopt on a kind mismatch.
    template <typename T> std::optional<T> as() const noexcept;

    /// @brief Parse @p text as a value of kind @p type.
    /// @details Integers accept an optional sign and a 0x, 0o or 0b radix
    ///          prefix; values wider than the kind are truncated to its width.
    ///          Floats accept the usual decimal and "nan"/"inf" spellings.
    static std::optional<Value> parse(std::string_view text, ValueType type);

    friend bool operator==(const Value &lhs, const Value &rhs) noexcept
    {
        return lhs.data_ == rhs.data_;
    }

  private:
    std::variant<int32_t, int64_t, F32, F64> data_{int32_t{0}};
};

template <typename T> std::optional<T> Value::as() const noexcept
{
    if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, uint32_t>)
    {
        if (const auto *v = std::get_if<int32_t>(&data_))
            return static_cast<T>(*v);
    }
    else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>)
    {
        if (const auto *v = std::get_if<int64_t>(&data_))
            return static_cast<T>(*v);
    }
    else if constexpr (std::is_same_v<T, F32> || std::is_same_v<T, float>)
    {
        if (const auto *v = std::get_if<F32>(&data_))
        {
            if constexpr (std::is_same_v<T, F32>)
                return *v;
            else
                return v->toFloat();
        }
    }
    else if constexpr (std::is_same_v<T, F64> || std::is_same_v<T, double>)
    {
        if (const auto *v = std::get_if<F64>(&data_))
        {
            if constexpr (std::is_same_v<T, F64>)
                return *v;
            else
                return v->toFloat();
        }
    }
    else
    {
        static_assert(sizeof(T) == 0, "unsupported Value view");
    }
    return std::nullopt;
}

/// @brief Format @p value for display, e.g. "i32 : 0x0000002a = 42".
std::string toString(const Value &value);

} // namespace wasmdbg::wasm
