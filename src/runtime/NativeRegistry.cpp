//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/runtime/NativeRegistry.cpp
// Purpose: Registration and lookup of host functions.
// Links: include/pgs/NativeRegistry.hpp
//
//===----------------------------------------------------------------------===//

#include "pgs/NativeRegistry.hpp"

#include <algorithm>

namespace pgs
{

using support::ErrorKind;
using support::makeError;

support::Expected<void> NativeRegistry::registerFunction(const std::string &module,
                                                         const std::string &name,
                                                         NativeSignature signature,
                                                         NativeHandler handler)
{
    if (module.empty() || name.empty())
        return makeError(ErrorKind::UnknownSymbol, {}, "native module and name must be non-empty");

    NativeBinding binding{module, name, std::move(signature), std::move(handler)};
    std::string qualified = binding.qualifiedName();
    if (index_.count(qualified))
    {
        return makeError(
            ErrorKind::DuplicateDefinition, {}, "native '" + qualified + "' is already registered");
    }
    index_.emplace(std::move(qualified), bindings_.size());
    bindings_.push_back(std::move(binding));
    return {};
}

const NativeBinding *NativeRegistry::find(const std::string &qualifiedName) const
{
    auto it = index_.find(qualifiedName);
    return it == index_.end() ? nullptr : &bindings_[it->second];
}

std::vector<std::string> NativeRegistry::modules() const
{
    std::vector<std::string> out;
    for (const auto &binding : bindings_)
    {
        if (std::find(out.begin(), out.end(), binding.module) == out.end())
            out.push_back(binding.module);
    }
    return out;
}

} // namespace pgs
