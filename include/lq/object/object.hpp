#pragma once

/// @file object.hpp
/// @brief Instances of runtime classes.

#include <any>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lq/core/value.hpp"
#include "lq/foundation/query_result.hpp"
#include "lq/object/class.hpp"

namespace lq::object {

/// An instance of exactly one Class.
///
/// Holds per-instance fields plus an optional native state slot for C++
/// data that has no Value representation.  Member reads fall back from
/// fields to the class chain.
class Object : public std::enable_shared_from_this<Object> {
public:
    /// Only Class::instantiateWith() creates objects, so every object
    /// has a class.
    class Key {
        Key() = default;
        friend class Class;
    };

    Object(Key, ClassRef cls, std::any nativeState);

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    [[nodiscard]] const ClassRef& klass() const noexcept { return class_; }

    /// Whether @p cls is this object's class or one of its ancestors.
    /// Compares class identity, not structure.
    [[nodiscard]] bool instanceOf(const Class& cls) const noexcept;

    /// Read a field, then a class member; nil when neither exists.
    [[nodiscard]] Value get(std::string_view name) const;

    /// Write a per-instance field.  Assigning nil removes the field.
    void set(std::string_view name, Value value);

    /// Per-instance fields (class members excluded).
    [[nodiscard]] const std::unordered_map<std::string, Value>& fields() const noexcept {
        return fields_;
    }

    /// Invoke the function member @p name with this object prepended to
    /// @p args.
    ///
    /// @return The function's result, MemberNotFound, or NotCallable.
    foundation::QueryResult<Value> call(std::string_view name, Arguments args = {});

    /// Native state of type @p T, or nullptr on type mismatch or absence.
    template <typename T>
    [[nodiscard]] const T* native() const noexcept {
        return std::any_cast<T>(&native_);
    }

    [[nodiscard]] bool hasNative() const noexcept { return native_.has_value(); }

private:
    ClassRef class_;
    std::unordered_map<std::string, Value> fields_;
    std::any native_;
};

} // namespace lq::object
