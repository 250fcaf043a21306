//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Memory.hpp
// Purpose: Page-granular linear memory with bounds-checked typed access.
// Key invariants: size() is always pages() * 64 KiB and never exceeds the
//                 declared maximum. Accesses are checked with 64-bit
//                 arithmetic so address + offset never wraps.
// Ownership/Lifetime: Owned by the VM; byte views are invalidated by grow().
// Links: wasm/Numeric.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "wasm/Module.hpp"
#include "wasm/Numeric.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace wasmdbg::vm
{

class LinearMemory
{
  public:
    /// @brief Allocate @p limits.min pages.
    /// @param hostMaxPages Host cap applied on top of the declared maximum.
    /// @throws std::bad_alloc when the initial pages cannot be allocated.
    explicit LinearMemory(const wasm::Limits &limits, uint32_t hostMaxPages = wasm::kMaxPages);

    uint32_t pages() const noexcept
    {
        return pages_;
    }

    std::size_t size() const noexcept
    {
        return bytes_.size();
    }

    /// @brief Grow by @p delta pages.
    /// @return Previous page count, or std::nullopt when a limit forbids it or
    ///         the host cannot allocate the pages.
    std::optional<uint32_t> grow(uint32_t delta);

    bool inBounds(uint64_t address, uint64_t length) const noexcept
    {
        return address <= bytes_.size() && length <= bytes_.size() - address;
    }

    /// @brief Load a little-endian @p T; std::nullopt when out of bounds.
    template <typename T> std::optional<T> load(uint64_t address) const
    {
        using Raw = typename wasm::numeric::RawOf<T>::type;
        if (!inBounds(address, sizeof(Raw)))
            return std::nullopt;
        return wasm::numeric::loadLittleEndian<T>(bytes_.data() + address);
    }

    /// @brief Store @p value little-endian; false when out of bounds.
    template <typename T> bool store(uint64_t address, T value)
    {
        using Raw = typename wasm::numeric::RawOf<T>::type;
        if (!inBounds(address, sizeof(Raw)))
            return false;
        wasm::numeric::storeLittleEndian<T>(value, bytes_.data() + address);
        return true;
    }

    /// @brief Copy @p data to @p address; false when it does not fit.
    bool write(uint64_t address, std::span<const uint8_t> data);

    /// @brief Overwrite the common prefix of this memory and @p image.
    void assignPrefix(std::span<const uint8_t> image);

    std::span<const uint8_t> bytes() const noexcept
    {
        return bytes_;
    }

  private:
    uint32_t pages_ = 0;
    uint32_t maxPages_ = wasm::kMaxPages;
    std::vector<uint8_t> bytes_;
};

} // namespace wasmdbg::vm
