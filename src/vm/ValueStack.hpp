//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/ValueStack.hpp
// Purpose: Operand stack shared by all frames of a VM.
// Key invariants: Reads never reach below the floor, which is the value-stack
//                 base of the innermost frame. size() never exceeds the limit
//                 given at construction.
// Ownership/Lifetime: Owned by the VM.
// Links: vm/VM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "wasm/Value.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace wasmdbg::vm
{

class ValueStack
{
  public:
    explicit ValueStack(std::size_t limit) : limit_(limit) {}

    std::size_t size() const noexcept
    {
        return values_.size();
    }

    /// @brief Number of values above the floor.
    std::size_t available() const noexcept
    {
        return values_.size() - floor_;
    }

    const std::vector<wasm::Value> &values() const noexcept
    {
        return values_;
    }

    std::size_t floor() const noexcept
    {
        return floor_;
    }

    void setFloor(std::size_t floor) noexcept
    {
        floor_ = floor;
    }

    /// @brief Value @p depth entries below the top (0 is the top).
    std::optional<wasm::Value> peek(std::size_t depth) const
    {
        if (depth >= available())
            return std::nullopt;
        return values_[values_.size() - 1 - depth];
    }

    /// @brief Typed peek; std::nullopt when absent or of another kind.
    template <typename T> std::optional<T> peekAs(std::size_t depth) const
    {
        if (depth >= available())
            return std::nullopt;
        return values_[values_.size() - 1 - depth].template as<T>();
    }

    /// @brief Push @p value; false when the stack is full.
    [[nodiscard]] bool push(wasm::Value value)
    {
        if (values_.size() >= limit_)
            return false;
        values_.push_back(value);
        return true;
    }

    /// @brief Put back a value removed by pop(); never limited.
    void restore(wasm::Value value)
    {
        values_.push_back(value);
    }

    void pop(std::size_t count)
    {
        values_.resize(values_.size() - count);
    }

    /// @brief Pop @p count values and push @p value in their place.
    void replace(std::size_t count, wasm::Value value)
    {
        pop(count);
        values_.push_back(value);
    }

    /// @brief Drop everything above @p height.
    void truncate(std::size_t height)
    {
        if (height < values_.size())
            values_.resize(height);
    }

    void clear() noexcept
    {
        values_.clear();
        floor_ = 0;
    }

  private:
    std::vector<wasm::Value> values_;
    std::size_t floor_ = 0;
    std::size_t limit_;
};

} // namespace wasmdbg::vm
