#pragma once

/// @file query.hpp
/// @brief Lazily evaluated query over a producer factory.
///
/// A Query wraps exactly one ProducerFactory.  Lazy operators (where,
/// select) return new queries that compose the previous factory and
/// consume nothing.  Terminal operators obtain a fresh producer and drive
/// it, so every terminal call is an independent traversal.

#include <optional>

#include "lq/core/value.hpp"
#include "lq/foundation/query_result.hpp"
#include "lq/object/class.hpp"
#include "lq/query/producer.hpp"

namespace lq::query {

/// Immutable, restartable query.
///
/// Each Query is backed by an object of the runtime class Queryable
/// (see klass()), whose native state is the producer factory.  This lets
/// a query travel as a plain Value and be recognised again by from().
///
/// Usage:
/// @code
///   auto squares = fromSequence(Sequence{1, 2, 3, 4})
///       .andThen([](const Query& q) { return q.where(isEven); })
///       .andThen([](const Query& q) { return q.select(square); });
///
///   Sequence out = squares.value().toSequence();   // [4, 16]
/// @endcode
class Query {
public:
    /// The runtime class every query object is an instance of.
    static const object::ClassRef& klass();

    /// Wrap @p factory.
    /// @return The query, or ExpectedProducerFunction if @p factory is empty.
    static foundation::QueryResult<Query> create(ProducerFactory factory);

    /// Recover a query from an object value.
    ///
    /// @return std::nullopt unless @p value is a Queryable instance (or a
    ///         subclass instance) carrying a producer factory.
    [[nodiscard]] static std::optional<Query> fromValue(const Value& value);

    // ── Lazy operators ──────────────────────────────────────────────────

    /// Keep the items for which @p predicate is true, in order.
    /// @return The filtered query, or ExpectedPredicate.
    foundation::QueryResult<Query> where(Predicate predicate) const;

    /// Transform every item with @p selector, 1:1, in order.
    /// @return The transformed query, or ExpectedSelector.
    foundation::QueryResult<Query> select(Selector selector) const;

    // ── Terminal operators ──────────────────────────────────────────────

    /// Drain into a sequence, in yield order.
    [[nodiscard]] Sequence toSequence() const;

    /// Drain into a mapping.
    ///
    /// Each pair-shaped item (see asKeyValuePair()) sets key -> value,
    /// last write wins.  Other items are skipped.
    [[nodiscard]] Mapping toMapping() const;

    /// A fresh producer for manual, pull-based consumption.
    [[nodiscard]] Producer toProducer() const;

    /// The first item, pulling exactly one; std::nullopt when empty.
    [[nodiscard]] std::optional<Value> first() const;

    /// The first item, or nil when empty.
    [[nodiscard]] Value firstOrNone() const;

    /// Whether every item satisfies @p predicate (true when empty).
    /// Stops at the first counterexample.
    foundation::QueryResult<bool> all(const Predicate& predicate) const;

    /// Whether some item satisfies @p predicate (false when empty).
    /// Stops at the first match.
    foundation::QueryResult<bool> any(const Predicate& predicate) const;

    // ── Interop ─────────────────────────────────────────────────────────

    /// This query as an object value.
    [[nodiscard]] Value toValue() const { return Value(object_); }

    /// The backing Queryable instance.
    [[nodiscard]] const ObjectRef& object() const noexcept { return object_; }

    /// Whether both handles refer to the same query object.
    friend bool operator==(const Query& lhs, const Query& rhs) noexcept {
        return lhs.object_ == rhs.object_;
    }

private:
    Query(ObjectRef object, const ProducerFactory* factory);

    ObjectRef object_;
    const ProducerFactory* factory_;
};

} // namespace lq::query
