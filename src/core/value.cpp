/// @file value.cpp
/// @brief Value construction, equality, hashing and display.

#include "lq/core/value.hpp"

#include <cmath>
#include <limits>
#include <sstream>

#include "lq/core/key_value_pair.hpp"
#include "lq/object/class.hpp"
#include "lq/object/object.hpp"

namespace lq {

namespace {

// boost::hash_combine mixing constant.
void hashCombine(std::size_t& seed, std::size_t h) noexcept {
    seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

// True when @p d holds an integral value representable as int64_t.
bool integralDouble(double d, int64_t& out) noexcept {
    if (!std::isfinite(d) || std::trunc(d) != d) {
        return false;
    }
    if (d < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
        d >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    out = static_cast<int64_t>(d);
    return true;
}

// Integer against Number compares exactly, never through a lossy double.
bool numericEqual(const Value& lhs, const Value& rhs) {
    if (lhs.isInteger() && rhs.isInteger()) {
        return lhs.asInteger() == rhs.asInteger();
    }
    if (!lhs.isInteger() && !rhs.isInteger()) {
        return lhs.asNumber() == rhs.asNumber();
    }
    const Value& integer = lhs.isInteger() ? lhs : rhs;
    const Value& number = lhs.isInteger() ? rhs : lhs;
    int64_t asInt = 0;
    return integralDouble(number.asNumber(), asInt) && asInt == integer.asInteger();
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Value::Value(Sequence items)
    : data_(std::make_shared<const Sequence>(std::move(items))) {}

Value::Value(Mapping entries)
    : data_(std::make_shared<const Mapping>(std::move(entries))) {}

Value::Value(KeyValuePair pair)
    : data_(std::make_shared<const KeyValuePair>(std::move(pair))) {}

Value::Value(NativeFunction fn) {
    if (fn) {
        data_ = std::make_shared<const NativeFunction>(std::move(fn));
    }
}

Value::Value(ObjectRef object) {
    if (object) {
        data_ = std::move(object);
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

bool Value::truthy() const noexcept {
    if (isNil()) {
        return false;
    }
    if (isBoolean()) {
        return std::get<bool>(data_);
    }
    return true;
}

double Value::asNumber() const {
    if (isInteger()) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    return std::get<double>(data_);
}

const Sequence& Value::asSequence() const {
    return *std::get<std::shared_ptr<const Sequence>>(data_);
}

const Mapping& Value::asMapping() const {
    return *std::get<std::shared_ptr<const Mapping>>(data_);
}

const KeyValuePair& Value::asPair() const {
    return *std::get<std::shared_ptr<const KeyValuePair>>(data_);
}

const NativeFunction& Value::asFunction() const {
    return *std::get<std::shared_ptr<const NativeFunction>>(data_);
}

Value Value::call(Arguments args) const {
    return asFunction()(args);
}

// ---------------------------------------------------------------------------
// Equality
// ---------------------------------------------------------------------------

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.isNumber() && rhs.isNumber()) {
        return numericEqual(lhs, rhs);
    }
    if (lhs.kind() != rhs.kind()) {
        return false;
    }

    switch (lhs.kind()) {
        case ValueKind::Nil:
            return true;
        case ValueKind::Boolean:
            return lhs.asBoolean() == rhs.asBoolean();
        case ValueKind::String:
            return lhs.asString() == rhs.asString();
        case ValueKind::Sequence: {
            const auto& a = std::get<std::shared_ptr<const Sequence>>(lhs.data_);
            const auto& b = std::get<std::shared_ptr<const Sequence>>(rhs.data_);
            return a == b || *a == *b;
        }
        case ValueKind::Mapping: {
            const auto& a = std::get<std::shared_ptr<const Mapping>>(lhs.data_);
            const auto& b = std::get<std::shared_ptr<const Mapping>>(rhs.data_);
            return a == b || *a == *b;
        }
        case ValueKind::Pair:
            return lhs.asPair() == rhs.asPair();
        case ValueKind::Function:
            return std::get<std::shared_ptr<const NativeFunction>>(lhs.data_) ==
                   std::get<std::shared_ptr<const NativeFunction>>(rhs.data_);
        case ValueKind::Object:
            return lhs.asObject() == rhs.asObject();
        case ValueKind::Integer:
        case ValueKind::Number:
            break;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Hashing
// ---------------------------------------------------------------------------

std::size_t ValueHash::operator()(const Value& value) const noexcept {
    std::size_t seed = static_cast<std::size_t>(value.kind());

    switch (value.kind()) {
        case ValueKind::Nil:
            return 0;
        case ValueKind::Boolean:
            return std::hash<bool>{}(value.asBoolean());
        case ValueKind::Integer:
            return std::hash<int64_t>{}(value.asInteger());
        case ValueKind::Number: {
            // Integral numbers must hash like the equal Integer.
            const double d = std::get<double>(value.data_);
            int64_t asInt = 0;
            if (integralDouble(d, asInt)) {
                return std::hash<int64_t>{}(asInt);
            }
            return std::hash<double>{}(d);
        }
        case ValueKind::String:
            return std::hash<std::string>{}(value.asString());
        case ValueKind::Sequence:
            for (const auto& item : value.asSequence()) {
                hashCombine(seed, (*this)(item));
            }
            return seed;
        case ValueKind::Mapping: {
            // Order-independent: entries are summed.
            std::size_t sum = 0;
            for (const auto& [k, v] : value.asMapping()) {
                std::size_t entry = (*this)(k);
                hashCombine(entry, (*this)(v));
                sum += entry;
            }
            hashCombine(seed, sum);
            return seed;
        }
        case ValueKind::Pair:
            hashCombine(seed, (*this)(value.asPair().key));
            hashCombine(seed, (*this)(value.asPair().value));
            return seed;
        case ValueKind::Function:
            return std::hash<const void*>{}(
                std::get<std::shared_ptr<const NativeFunction>>(value.data_).get());
        case ValueKind::Object:
            return std::hash<const void*>{}(value.asObject().get());
    }
    return seed;
}

// ---------------------------------------------------------------------------
// Display
// ---------------------------------------------------------------------------

std::string Value::toDisplayString() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    switch (value.kind()) {
        case ValueKind::Nil:
            return os << "nil";
        case ValueKind::Boolean:
            return os << (value.asBoolean() ? "true" : "false");
        case ValueKind::Integer:
            return os << value.asInteger();
        case ValueKind::Number:
            return os << value.asNumber();
        case ValueKind::String:
            return os << '"' << value.asString() << '"';
        case ValueKind::Sequence: {
            os << '[';
            bool first = true;
            for (const auto& item : value.asSequence()) {
                if (!first) {
                    os << ", ";
                }
                os << item;
                first = false;
            }
            return os << ']';
        }
        case ValueKind::Mapping: {
            os << '{';
            bool first = true;
            for (const auto& [k, v] : value.asMapping()) {
                if (!first) {
                    os << ", ";
                }
                os << k << ": " << v;
                first = false;
            }
            return os << '}';
        }
        case ValueKind::Pair:
            return os << '(' << value.asPair().key << " => " << value.asPair().value << ')';
        case ValueKind::Function:
            return os << "<function>";
        case ValueKind::Object:
            return os << '<' << value.asObject()->klass()->name() << " object>";
    }
    return os;
}

// ---------------------------------------------------------------------------
// Key/value pair shape detection
// ---------------------------------------------------------------------------

namespace {

// Nil and NaN never compare equal to a stored key.
bool isUsableKey(const Value& key) {
    if (key.isNil()) {
        return false;
    }
    return key.kind() != ValueKind::Number || !std::isnan(key.asNumber());
}

} // namespace

std::optional<KeyValuePair> asKeyValuePair(const Value& item) {
    if (item.isPair()) {
        const auto& pair = item.asPair();
        if (!isUsableKey(pair.key)) {
            return std::nullopt;
        }
        return pair;
    }

    if (item.isMapping()) {
        const auto& record = item.asMapping();
        auto keyIt = record.find(Value(kPairKeyField));
        if (keyIt == record.end() || !isUsableKey(keyIt->second)) {
            return std::nullopt;
        }
        auto valueIt = record.find(Value(kPairValueField));
        return KeyValuePair{keyIt->second,
                            valueIt != record.end() ? valueIt->second : Value()};
    }

    return std::nullopt;
}

} // namespace lq
