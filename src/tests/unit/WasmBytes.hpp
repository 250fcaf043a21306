//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/WasmBytes.hpp
// Purpose: Hand-assembled WebAssembly binaries for loader and session tests.
// Key invariants: Section payload sizes are computed, never written by hand.
// Ownership/Lifetime: Temporary files are removed by TempWasmFile's destructor.
// Links: src/wasm/ModuleLoader.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace wasmdbg_test
{

using Bytes = std::vector<uint8_t>;

inline Bytes uleb(uint64_t value)
{
    Bytes out;
    do
    {
        uint8_t byte = value & 0x7F;
        value >>= 7;
        if (value != 0)
            byte |= 0x80;
        out.push_back(byte);
    } while (value != 0);
    return out;
}

inline Bytes sleb(int64_t value)
{
    Bytes out;
    bool more = true;
    while (more)
    {
        uint8_t byte = value & 0x7F;
        value >>= 7;
        if ((value == 0 && (byte & 0x40) == 0) || (value == -1 && (byte & 0x40) != 0))
            more = false;
        else
            byte |= 0x80;
        out.push_back(byte);
    }
    return out;
}

inline void append(Bytes &out, const Bytes &tail)
{
    out.insert(out.end(), tail.begin(), tail.end());
}

inline Bytes concat(std::initializer_list<Bytes> parts)
{
    Bytes out;
    for (const auto &part : parts)
        append(out, part);
    return out;
}

/// @brief Length-prefixed UTF-8 name.
inline Bytes name(const std::string &text)
{
    Bytes out = uleb(text.size());
    out.insert(out.end(), text.begin(), text.end());
    return out;
}

/// @brief Count-prefixed vector of already encoded items.
inline Bytes vec(std::initializer_list<Bytes> items)
{
    Bytes out = uleb(items.size());
    for (const auto &item : items)
        append(out, item);
    return out;
}

inline Bytes section(uint8_t id, const Bytes &payload)
{
    Bytes out{id};
    append(out, uleb(payload.size()));
    append(out, payload);
    return out;
}

/// @brief Function body: no declared locals, @p code must end with 0x0B.
inline Bytes body(const Bytes &code)
{
    Bytes inner{0x00};
    append(inner, code);
    Bytes out = uleb(inner.size());
    append(out, inner);
    return out;
}

inline Bytes header()
{
    return {0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00};
}

/// @brief The session fixture used by the debugger and shell tests.
///
/// Functions:
///   f0 add(a: i32, b: i32) -> i32   local.get 0; local.get 1; i32.add; end
///   f1 main()                       i32.const 2; i32.const 3; call 0; global.set 0; end
///   f2 store()                      i32.const 16; i32.const 42; i32.store; end
///   f3 boom() -> i32                i32.const 1; i32.const 0; i32.div_s; end
/// One page of memory, one mutable i32 global, exports "main", "add",
/// "store" and "boom", and a name section naming every function and the
/// locals of add.
inline Bytes sessionModule()
{
    const Bytes types = vec({
        {0x60, 0x02, 0x7F, 0x7F, 0x01, 0x7F},
        {0x60, 0x00, 0x00},
        {0x60, 0x00, 0x01, 0x7F},
    });
    const Bytes funcs = vec({{0x00}, {0x01}, {0x01}, {0x02}});
    const Bytes memory = vec({{0x00, 0x01}});
    const Bytes globals = vec({{0x7F, 0x01, 0x41, 0x00, 0x0B}});
    const Bytes exports = vec({
        concat({name("main"), {0x00, 0x01}}),
        concat({name("add"), {0x00, 0x00}}),
        concat({name("store"), {0x00, 0x02}}),
        concat({name("boom"), {0x00, 0x03}}),
    });
    const Bytes code = vec({
        body({0x20, 0x00, 0x20, 0x01, 0x6A, 0x0B}),
        body({0x41, 0x02, 0x41, 0x03, 0x10, 0x00, 0x24, 0x00, 0x0B}),
        body({0x41, 0x10, 0x41, 0x2A, 0x36, 0x02, 0x00, 0x0B}),
        body({0x41, 0x01, 0x41, 0x00, 0x6D, 0x0B}),
    });
    const Bytes functionNames = vec({
        concat({uleb(0), name("add")}),
        concat({uleb(1), name("main")}),
        concat({uleb(2), name("store")}),
        concat({uleb(3), name("boom")}),
    });
    const Bytes localNames = vec({concat({uleb(0), vec({concat({uleb(0), name("a")}),
                                                        concat({uleb(1), name("b")})})})});
    const Bytes names =
        concat({name("name"), section(1, functionNames), section(2, localNames)});

    return concat({header(),
                   section(1, types),
                   section(3, funcs),
                   section(5, memory),
                   section(6, globals),
                   section(7, exports),
                   section(10, code),
                   section(0, names)});
}

/// @brief Binary written to a unique temporary path for the lifetime of the object.
class TempWasmFile
{
  public:
    explicit TempWasmFile(const Bytes &bytes)
    {
        static std::atomic<unsigned> counter{0};
        path_ = (std::filesystem::temp_directory_path() /
                 ("wasmdbg_test_" + std::to_string(::getpid()) + "_" +
                  std::to_string(counter.fetch_add(1)) + ".wasm"))
                    .string();
        std::ofstream out(path_, std::ios::binary);
        out.write(reinterpret_cast<const char *>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }

    ~TempWasmFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempWasmFile(const TempWasmFile &) = delete;
    TempWasmFile &operator=(const TempWasmFile &) = delete;

    const std::string &path() const noexcept
    {
        return path_;
    }

  private:
    std::string path_;
};

} // namespace wasmdbg_test
