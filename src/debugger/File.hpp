//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debugger/File.hpp
// Purpose: A loaded binary: its path, its decoded module and the breakpoint
//          registry that belongs to it.
// Key invariants: module() is never null. The registry outlives any VM built
//                 from this file because both hold it by shared_ptr.
// Ownership/Lifetime: Owned by the Debugger; module and registry are shared
//                     with every VM created from the file.
// Links: include/wasmdbg/debugger/Debugger.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Breakpoints.hpp"
#include "wasm/Module.hpp"

#include <memory>
#include <string>

namespace wasmdbg::debugger
{

class File
{
  public:
    File(std::string path, std::shared_ptr<const wasm::Module> module)
        : path_(std::move(path)), module_(std::move(module)),
          breakpoints_(std::make_shared<vm::Breakpoints>())
    {
    }

    const std::string &path() const noexcept
    {
        return path_;
    }

    const wasm::Module &module() const noexcept
    {
        return *module_;
    }

    const std::shared_ptr<const wasm::Module> &sharedModule() const noexcept
    {
        return module_;
    }

    vm::Breakpoints &breakpoints() const noexcept
    {
        return *breakpoints_;
    }

    const vm::SharedBreakpoints &sharedBreakpoints() const noexcept
    {
        return breakpoints_;
    }

  private:
    std::string path_;
    std::shared_ptr<const wasm::Module> module_;
    vm::SharedBreakpoints breakpoints_;
};

} // namespace wasmdbg::debugger
