//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/BinaryReader.cpp
// Purpose: LEB128 and fixed-width decoding for the module loader.
// Key invariants: Over-long or overflowing LEB128 encodings are rejected.
// Ownership/Lifetime: See BinaryReader.hpp.
// Links: https://webassembly.github.io/spec/core/binary/values.html
//
//===----------------------------------------------------------------------===//

#include "wasm/BinaryReader.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace wasmdbg::wasm
{

std::string toString(const LoadError &error)
{
    std::ostringstream os;
    os << "offset 0x" << std::hex << error.offset << ": " << error.message;
    return os.str();
}

BinaryReader::BinaryReader(std::span<const uint8_t> bytes) : bytes_(bytes), limit_(bytes.size()) {}

std::size_t BinaryReader::pushLimit(std::size_t size)
{
    const std::size_t previous = limit_;
    if (size > remaining())
    {
        fail("length out of bounds");
        return previous;
    }
    limit_ = pos_ + size;
    return previous;
}

void BinaryReader::fail(std::string message)
{
    if (!error_)
        error_ = LoadError{std::move(message), pos_};
}

uint8_t BinaryReader::readByte()
{
    if (!ok())
        return 0;
    if (atLimit())
    {
        fail("unexpected end of data");
        return 0;
    }
    return bytes_[pos_++];
}

uint32_t BinaryReader::readFixedU32()
{
    uint32_t value = 0;
    for (unsigned i = 0; i < 4; ++i)
        value |= static_cast<uint32_t>(readByte()) << (8U * i);
    return value;
}

uint64_t BinaryReader::readFixedU64()
{
    uint64_t value = 0;
    for (unsigned i = 0; i < 8; ++i)
        value |= static_cast<uint64_t>(readByte()) << (8U * i);
    return value;
}

uint32_t BinaryReader::readVarU32()
{
    uint32_t result = 0;
    for (unsigned i = 0; i < 5; ++i)
    {
        const uint8_t byte = readByte();
        if (!ok())
            return 0;
        if (i == 4 && (byte & 0xF0U) != 0)
        {
            fail("integer representation too long");
            return 0;
        }
        result |= static_cast<uint32_t>(byte & 0x7FU) << (7U * i);
        if ((byte & 0x80U) == 0)
            return result;
    }
    fail("integer representation too long");
    return 0;
}

template <typename T> T BinaryReader::readSigned(unsigned maxBytes)
{
    using U = std::make_unsigned_t<T>;
    constexpr unsigned kBits = sizeof(T) * 8;
    U result = 0;
    unsigned shift = 0;
    for (unsigned i = 0; i < maxBytes; ++i)
    {
        const uint8_t byte = readByte();
        if (!ok())
            return 0;
        if (i == maxBytes - 1)
        {
            // Unused bits of the final byte must replicate the sign bit.
            const unsigned usedBits = kBits - shift;
            const uint8_t signAndUnused = static_cast<uint8_t>(byte & 0x7FU) >> (usedBits - 1);
            const uint8_t allOnes = static_cast<uint8_t>(0x7FU >> (usedBits - 1));
            if ((byte & 0x80U) != 0 || (signAndUnused != 0 && signAndUnused != allOnes))
            {
                fail("integer too large");
                return 0;
            }
        }
        result |= static_cast<U>(static_cast<U>(byte & 0x7FU) << shift);
        shift += 7;
        if ((byte & 0x80U) == 0)
        {
            if (shift < kBits && (byte & 0x40U) != 0)
                result |= static_cast<U>(~U{0} << shift);
            return static_cast<T>(result);
        }
    }
    fail("integer representation too long");
    return 0;
}

int32_t BinaryReader::readVarS32()
{
    return readSigned<int32_t>(5);
}

int64_t BinaryReader::readVarS64()
{
    return readSigned<int64_t>(10);
}

uint32_t BinaryReader::readCount()
{
    const uint32_t count = readVarU32();
    if (ok() && count > remaining())
    {
        fail("vector length exceeds remaining data");
        return 0;
    }
    return count;
}

std::string BinaryReader::readName()
{
    const uint32_t size = readCount();
    auto bytes = readBytes(size);
    return std::string(bytes.begin(), bytes.end());
}

std::span<const uint8_t> BinaryReader::readBytes(std::size_t size)
{
    if (!ok())
        return {};
    if (size > remaining())
    {
        fail("unexpected end of data");
        return {};
    }
    auto view = bytes_.subspan(pos_, size);
    pos_ += size;
    return view;
}

} // namespace wasmdbg::wasm
