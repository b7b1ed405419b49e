//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/pgs/NativeRegistry.hpp
// Purpose: Host functions callable from scripts, grouped by module.
// Key invariants: A qualified name ("module::name") is registered at most
//                 once.  Registration is append-only.
// Ownership/Lifetime: The registry owns its handlers.  It must outlive every
//                     run() that uses it; runs only read it.
// Links: include/pgs/StdLib.hpp, src/bytecode/BytecodeVM.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pgs/Value.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pgs
{

/// @brief Host callback.  @p result starts as unit; write the return value there.
using NativeHandler = std::function<void(const Value *args, uint32_t argc, Value *result)>;

/// @brief Parameter and return kinds checked by the VM around every call.
struct NativeSignature
{
    std::vector<ValueKind> params;
    ValueKind ret = ValueKind::Unit;
};

/// @brief One registered host function.
struct NativeBinding
{
    std::string module;
    std::string name;
    NativeSignature signature;
    NativeHandler handler;

    std::string qualifiedName() const
    {
        return module + "::" + name;
    }
};

class NativeRegistry
{
  public:
    /// @brief Register @p handler as `module::name`.
    /// @return DuplicateDefinition if the qualified name is already taken.
    support::Expected<void> registerFunction(const std::string &module,
                                             const std::string &name,
                                             NativeSignature signature,
                                             NativeHandler handler);

    /// @brief Look up a binding by qualified name, e.g. "std::println".
    /// @return Null when nothing is registered under that name.
    const NativeBinding *find(const std::string &qualifiedName) const;

    /// @brief Number of registered functions.
    size_t size() const
    {
        return bindings_.size();
    }

    /// @brief Module names in first-registration order.
    std::vector<std::string> modules() const;

    /// @brief All bindings in registration order.
    const std::vector<NativeBinding> &bindings() const
    {
        return bindings_;
    }

  private:
    std::vector<NativeBinding> bindings_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace pgs
