//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/pgs/Value.hpp
// Purpose: Tagged runtime value shared by the VM, natives and embedders.
// Invariants: The active alternative always matches kind().  Struct values
//             share their instance by reference; every other kind copies.
// Ownership: Value owns strings by value and holds structs and native handles
//            through std::shared_ptr; the last reference frees the object.
// Links: include/pgs/NativeRegistry.hpp, src/bytecode/BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pgs
{

/// @brief Runtime kind of a Value.
/// @details The enumerator order matches the alternatives of Value's variant.
enum class ValueKind : uint8_t
{
    Int,
    Float,
    Str,
    Bool,
    Unit,
    Struct,
    NativeHandle,
};

/// @brief Lower-case spelling of @p kind ("int", "float", ...).
const char *toString(ValueKind kind);

struct StructInstance;

/// @brief Opaque host object passed through scripts untouched.
struct NativeHandle
{
    std::shared_ptr<void> ptr;
    std::string tag; ///< Host-defined type tag.
};

class Value
{
  public:
    /// @brief Construct the unit value.
    Value() : data_(std::monostate{}) {}

    static Value integer(int64_t v)
    {
        return Value(Storage(std::in_place_index<0>, v));
    }

    static Value floating(double v)
    {
        return Value(Storage(std::in_place_index<1>, v));
    }

    static Value string(std::string v)
    {
        return Value(Storage(std::in_place_index<2>, std::move(v)));
    }

    static Value boolean(bool v)
    {
        return Value(Storage(std::in_place_index<3>, v));
    }

    static Value unit()
    {
        return Value();
    }

    static Value structure(std::shared_ptr<StructInstance> v)
    {
        return Value(Storage(std::in_place_index<5>, std::move(v)));
    }

    static Value handle(NativeHandle v)
    {
        return Value(Storage(std::in_place_index<6>, std::move(v)));
    }

    ValueKind kind() const
    {
        return static_cast<ValueKind>(data_.index());
    }

    bool is(ValueKind k) const
    {
        return kind() == k;
    }

    /// @name Accessors
    /// @brief Each requires the matching kind().
    /// @{
    int64_t asInt() const
    {
        return std::get<0>(data_);
    }

    double asFloat() const
    {
        return std::get<1>(data_);
    }

    const std::string &asString() const
    {
        return std::get<2>(data_);
    }

    bool asBool() const
    {
        return std::get<3>(data_);
    }

    const std::shared_ptr<StructInstance> &asStruct() const
    {
        return std::get<5>(data_);
    }

    const NativeHandle &asHandle() const
    {
        return std::get<6>(data_);
    }

    /// @}

    /// @brief Render the value for printing and diagnostics.
    /// @details Floats always carry a decimal point or exponent (`5.0`), and
    ///          structs render as `Name{field, ...}`.
    std::string toString() const;

    /// @brief Script-level equality.
    /// @details Values of different kinds are never equal.  Structs and
    ///          native handles compare by identity.
    bool operator==(const Value &other) const;

    bool operator!=(const Value &other) const
    {
        return !(*this == other);
    }

  private:
    using Storage = std::variant<int64_t,
                                 double,
                                 std::string,
                                 bool,
                                 std::monostate,
                                 std::shared_ptr<StructInstance>,
                                 NativeHandle>;

    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

/// @brief Heap instance of a container; shared by every Value that holds it.
struct StructInstance
{
    std::string typeName;
    std::vector<Value> fields; ///< In declaration order.
};

} // namespace pgs
