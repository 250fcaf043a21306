//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Memory.cpp
// Purpose: Growth and bulk copies for linear memory.
// Key invariants: New pages are zero-filled; a failed grow leaves the memory
//                 unchanged.
// Ownership/Lifetime: See Memory.hpp.
// Links: vm/Memory.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Memory.hpp"

#include <algorithm>
#include <new>

namespace wasmdbg::vm
{

LinearMemory::LinearMemory(const wasm::Limits &limits, uint32_t hostMaxPages)
    : pages_(limits.min),
      maxPages_(std::min({limits.max.value_or(wasm::kMaxPages), wasm::kMaxPages, hostMaxPages})),
      bytes_(static_cast<std::size_t>(limits.min) * wasm::kPageSize, 0)
{
}

std::optional<uint32_t> LinearMemory::grow(uint32_t delta)
{
    const uint32_t previous = pages_;
    if (pages_ > maxPages_ || delta > maxPages_ - pages_)
        return std::nullopt;
    try
    {
        bytes_.resize(static_cast<std::size_t>(pages_ + delta) * wasm::kPageSize, 0);
    }
    catch (const std::bad_alloc &)
    {
        return std::nullopt;
    }
    pages_ += delta;
    return previous;
}

bool LinearMemory::write(uint64_t address, std::span<const uint8_t> data)
{
    if (!inBounds(address, data.size()))
        return false;
    std::copy(data.begin(), data.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(address));
    return true;
}

void LinearMemory::assignPrefix(std::span<const uint8_t> image)
{
    const std::size_t count = std::min(image.size(), bytes_.size());
    std::copy_n(image.begin(), count, bytes_.begin());
}

} // namespace wasmdbg::vm
