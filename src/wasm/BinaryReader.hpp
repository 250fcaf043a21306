//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/BinaryReader.hpp
// Purpose: Cursor over a WebAssembly binary with LEB128 decoding and sticky
//          error reporting.
// Key invariants: The first failure is recorded with its byte offset and all
//                 later reads return zero values without advancing. Reads
//                 never cross the current limit.
// Ownership/Lifetime: Borrows the byte buffer; the buffer must outlive the
//                     reader.
// Links: wasm/ModuleLoader.hpp, wasm/DebugInfo.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace wasmdbg::wasm
{

/// @brief Decoding failure with the byte offset where it was detected.
struct LoadError
{
    std::string message;
    std::size_t offset = 0;
};

/// @brief Format @p error as "offset 0x1c: message".
std::string toString(const LoadError &error);

class BinaryReader
{
  public:
    explicit BinaryReader(std::span<const uint8_t> bytes);

    [[nodiscard]] bool ok() const noexcept
    {
        return !error_.has_value();
    }

    [[nodiscard]] const std::optional<LoadError> &error() const noexcept
    {
        return error_;
    }

    std::size_t position() const noexcept
    {
        return pos_;
    }

    std::size_t remaining() const noexcept
    {
        return limit_ - pos_;
    }

    bool atLimit() const noexcept
    {
        return pos_ >= limit_;
    }

    /// @brief Restrict reads to the next @p size bytes.
    /// @return The previous limit, to be passed to restoreLimit().
    std::size_t pushLimit(std::size_t size);

    /// @brief Reinstate a limit returned by pushLimit().
    void restoreLimit(std::size_t limit) noexcept
    {
        limit_ = limit;
    }

    /// @brief Record a failure at the current offset unless one is recorded.
    void fail(std::string message);

    uint8_t readByte();
    uint32_t readFixedU32();
    uint64_t readFixedU64();
    uint32_t readVarU32();
    int32_t readVarS32();
    int64_t readVarS64();

    /// @brief Read a vector length, rejecting counts larger than the bytes left.
    uint32_t readCount();

    /// @brief Read a length-prefixed UTF-8 name.
    std::string readName();

    /// @brief Consume @p size raw bytes.
    std::span<const uint8_t> readBytes(std::size_t size);

  private:
    template <typename T> T readSigned(unsigned maxBytes);

    std::span<const uint8_t> bytes_;
    std::size_t pos_ = 0;
    std::size_t limit_ = 0;
    std::optional<LoadError> error_;
};

} // namespace wasmdbg::wasm
