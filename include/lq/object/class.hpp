#pragma once

/// @file class.hpp
/// @brief Prototype classes with single inheritance and membership tests.
///
/// A Class is a named, immutable member table with an optional parent.
/// Creating a child copies down every parent member the child does not
/// define itself, and records the parent as the superclass link used by
/// Object::instanceOf() and Class::classOf().

#include <any>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lq/core/value.hpp"
#include "lq/foundation/query_result.hpp"

namespace lq::object {

class Class;

/// Shared, immutable handle to a class.
using ClassRef = std::shared_ptr<const Class>;

/// Member table: name -> function or data value.
using Members = std::unordered_map<std::string, Value>;

/// Name of the optional initializer member.
inline constexpr std::string_view kInitMember = "init";

/// Runtime class with single-parent inheritance.
///
/// Classes are created through make() and never change afterwards.  A
/// class must outlive its objects; objects keep their class alive through
/// a ClassRef.
///
/// Usage:
/// @code
///   auto shape = Class::make("Shape", {
///       {"init", Value::function([](Arguments args) {
///            args[0].asObject()->set("sides", args[1]);
///            return Value();
///        })},
///   });
///   auto square = Class::make("Square", {}, shape);
///
///   auto obj = square->instantiate(std::vector<Value>{4}).value();
///   obj->instanceOf(*shape);       // true
///   shape->classOf(Value(obj));    // true
/// @endcode
class Class : public std::enable_shared_from_this<Class> {
    /// Restricts construction to make().
    class Token {
        Token() = default;
        friend class Class;
    };

public:
    Class(Token, std::string name, Members members, ClassRef parent);

    /// Create a class.
    ///
    /// If @p parent is given, each parent member whose name is absent
    /// from @p members is copied into the new class.
    static ClassRef make(std::string name, Members members = {},
                         ClassRef parent = nullptr);

    Class(const Class&) = delete;
    Class& operator=(const Class&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Superclass link (nullptr for a root class).
    [[nodiscard]] const ClassRef& parent() const noexcept { return parent_; }

    /// Members defined on or copied into this class.
    [[nodiscard]] const Members& members() const noexcept { return members_; }

    /// Whether @p name is in this class's own member table.
    [[nodiscard]] bool hasOwnMember(std::string_view name) const;

    /// Look up a member on this class, then along the parent chain.
    /// Returns nullptr when no class in the chain defines it.
    [[nodiscard]] const Value* findMember(std::string_view name) const;

    /// Whether this class is @p other or derives from it.
    [[nodiscard]] bool isSubclassOf(const Class& other) const noexcept;

    /// Create an object of this class and run its initializer.
    ///
    /// When the class has an "init" member it is called with the new
    /// object followed by @p args.
    ///
    /// @return The object, or NotCallable if "init" is not a function.
    foundation::QueryResult<ObjectRef> instantiate(Arguments args = {}) const;

    /// Same as instantiate(), with native per-instance state attached
    /// before the initializer runs.
    foundation::QueryResult<ObjectRef> instantiateWith(std::any nativeState,
                                                       Arguments args = {}) const;

    /// Whether @p value is an object of this class or of a subclass.
    ///
    /// Safe on any value: non-objects yield false.
    [[nodiscard]] bool classOf(const Value& value) const;

private:
    std::string name_;
    Members members_;
    ClassRef parent_;
};

} // namespace lq::object
