#pragma once

/// @file producer.hpp
/// @brief Pull-based producers and the factories that create them.
///
/// A producer is a single-use cursor: each next() call yields one item
/// until std::nullopt signals the end.  A producer factory manufactures a
/// fresh, independent producer on every call, which is what makes a Query
/// restartable.

#include <functional>
#include <memory>
#include <optional>

#include "lq/core/value.hpp"

namespace lq::query {

/// Resumable cursor over a sequence of values.
///
/// Not thread-safe; a producer is owned and pulled by a single caller.
class IProducer {
public:
    virtual ~IProducer() = default;

    /// Pull the next item, or std::nullopt once exhausted.
    virtual std::optional<Value> next() = 0;
};

/// Owning handle to a producer.
using Producer = std::unique_ptr<IProducer>;

/// Zero-argument function returning a fresh producer on each call.
using ProducerFactory = std::function<Producer()>;

/// Callable form of a producer's next().
using PullFunction = std::function<std::optional<Value>()>;

/// Unary test applied to each item.
using Predicate = std::function<bool(const Value&)>;

/// Unary transform applied to each item.
using Selector = std::function<Value(const Value&)>;

/// Adapt a pull function into a Producer.
///
/// Usage:
/// @code
///   ProducerFactory countdown = [] {
///       return makeProducer([n = 3]() mutable -> std::optional<Value> {
///           if (n == 0) return std::nullopt;
///           return Value(n--);
///       });
///   };
/// @endcode
[[nodiscard]] Producer makeProducer(PullFunction pull);

/// Drive @p producer to exhaustion, invoking @p sink for each item.
/// Stops early when @p sink returns false.
template <typename Sink>
void drain(IProducer& producer, Sink&& sink) {
    while (auto item = producer.next()) {
        if (!sink(*item)) {
            return;
        }
    }
}

} // namespace lq::query
