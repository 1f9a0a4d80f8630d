#pragma once

/// @file value.hpp
/// @brief Dynamic value model shared by the object system and query engine.
///
/// A Value is a tagged variant over the host data the library adapts:
/// scalars, strings, ordered sequences, key/value mappings, key/value
/// pairs, native functions and runtime objects.  Container payloads are
/// immutable and shared, so copying a Value never copies its elements.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace lq {

namespace object {
class Object;
} // namespace object

class Value;
struct KeyValuePair;
struct ValueHash;

/// Ordered, indexable sequence of values.
using Sequence = std::vector<Value>;

/// Unordered key/value collection.  Iteration order is unspecified.
using Mapping = std::unordered_map<Value, Value, ValueHash>;

/// Positional arguments passed to a native function.
using Arguments = std::span<const Value>;

/// Callable stored inside a Value.
using NativeFunction = std::function<Value(Arguments)>;

/// Shared handle to a runtime object.
using ObjectRef = std::shared_ptr<object::Object>;

/// Discriminator for the alternatives a Value may hold.
enum class ValueKind : uint8_t {
    Nil      = 0,
    Boolean  = 1,
    Integer  = 2,
    Number   = 3,
    String   = 4,
    Sequence = 5,
    Mapping  = 6,
    Pair     = 7,
    Function = 8,
    Object   = 9
};

/// Return the display name for a value kind.
constexpr std::string_view valueKindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Nil:      return "nil";
        case ValueKind::Boolean:  return "boolean";
        case ValueKind::Integer:  return "integer";
        case ValueKind::Number:   return "number";
        case ValueKind::String:   return "string";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Mapping:  return "mapping";
        case ValueKind::Pair:     return "pair";
        case ValueKind::Function: return "function";
        case ValueKind::Object:   return "object";
    }
    return "unknown";
}

/// Dynamically typed value.
///
/// Equality is by value for scalars and strings (Integer and Number
/// compare numerically), structural for sequences, mappings and pairs,
/// and by identity for functions and objects.
///
/// The typed accessors (asInteger(), asSequence(), ...) require the
/// matching kind; calling one on a different kind is undefined behavior,
/// in the same way as Result::value() on an error.
///
/// Example:
/// @code
///   Value numbers = Sequence{1, 2, 3};
///   Value table = Mapping{{"a", 1}, {"b", 2}};
///   Value twice = Value::function([](Arguments args) {
///       return Value(args[0].asInteger() * 2);
///   });
/// @endcode
class Value {
public:
    /// Nil.
    Value() = default;
    Value(std::nullptr_t) {}

    Value(bool b) : data_(b) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T i) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            // Too large for Integer: keep the magnitude as a Number.
            if (i > static_cast<T>(std::numeric_limits<int64_t>::max())) {
                data_ = static_cast<double>(i);
                return;
            }
        }
        data_ = static_cast<int64_t>(i);
    }

    Value(double d) : data_(d) {}

    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}

    Value(Sequence items);
    Value(Mapping entries);
    Value(KeyValuePair pair);
    Value(NativeFunction fn);
    Value(ObjectRef object);

    /// Wrap any callable taking Arguments as a Function value.
    template <typename F>
    static Value function(F&& fn) {
        return Value(NativeFunction(std::forward<F>(fn)));
    }

    [[nodiscard]] ValueKind kind() const noexcept {
        return static_cast<ValueKind>(data_.index());
    }

    [[nodiscard]] bool isNil() const noexcept { return kind() == ValueKind::Nil; }
    [[nodiscard]] bool isBoolean() const noexcept { return kind() == ValueKind::Boolean; }
    [[nodiscard]] bool isInteger() const noexcept { return kind() == ValueKind::Integer; }
    [[nodiscard]] bool isNumber() const noexcept {
        return kind() == ValueKind::Number || kind() == ValueKind::Integer;
    }
    [[nodiscard]] bool isString() const noexcept { return kind() == ValueKind::String; }
    [[nodiscard]] bool isSequence() const noexcept { return kind() == ValueKind::Sequence; }
    [[nodiscard]] bool isMapping() const noexcept { return kind() == ValueKind::Mapping; }
    [[nodiscard]] bool isPair() const noexcept { return kind() == ValueKind::Pair; }
    [[nodiscard]] bool isFunction() const noexcept { return kind() == ValueKind::Function; }
    [[nodiscard]] bool isObject() const noexcept { return kind() == ValueKind::Object; }

    /// Nil and false are falsy; everything else is truthy.
    [[nodiscard]] bool truthy() const noexcept;

    [[nodiscard]] bool asBoolean() const { return std::get<bool>(data_); }
    [[nodiscard]] int64_t asInteger() const { return std::get<int64_t>(data_); }

    /// Numeric value of an Integer or Number.
    [[nodiscard]] double asNumber() const;

    [[nodiscard]] const std::string& asString() const { return std::get<std::string>(data_); }
    [[nodiscard]] const Sequence& asSequence() const;
    [[nodiscard]] const Mapping& asMapping() const;
    [[nodiscard]] const KeyValuePair& asPair() const;
    [[nodiscard]] const NativeFunction& asFunction() const;
    [[nodiscard]] const ObjectRef& asObject() const { return std::get<ObjectRef>(data_); }

    /// Invoke a Function value (undefined behavior for other kinds).
    Value call(Arguments args = {}) const;

    /// Human-readable rendering used by logging and test output.
    [[nodiscard]] std::string toDisplayString() const;

    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    friend struct ValueHash;

    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 std::shared_ptr<const Sequence>,
                 std::shared_ptr<const Mapping>,
                 std::shared_ptr<const KeyValuePair>,
                 std::shared_ptr<const NativeFunction>,
                 ObjectRef>
        data_;
};

/// Hash consistent with Value equality.
struct ValueHash {
    std::size_t operator()(const Value& value) const noexcept;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

/// The shared nil value.
inline const Value kNil{};

} // namespace lq
