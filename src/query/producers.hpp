#pragma once

/// @file producers.hpp
/// @brief Concrete producers behind the source adapters and operators.

#include <cstddef>
#include <optional>

#include "lq/core/value.hpp"
#include "lq/query/producer.hpp"

namespace lq::query::detail {

/// Yields the elements of a Sequence value in index order.
class SequenceProducer final : public IProducer {
public:
    explicit SequenceProducer(Value sequence);
    std::optional<Value> next() override;

private:
    Value sequence_;
    std::size_t index_ = 0;
};

/// Yields one Pair per entry of a Mapping value.
class MappingProducer final : public IProducer {
public:
    explicit MappingProducer(Value mapping);
    std::optional<Value> next() override;

private:
    Value mapping_;
    Mapping::const_iterator cursor_;
};

/// Yields only upstream items accepted by a predicate.
class WhereProducer final : public IProducer {
public:
    WhereProducer(Producer upstream, Predicate predicate);
    std::optional<Value> next() override;

private:
    Producer upstream_;
    Predicate predicate_;
};

/// Yields selector(item) for every upstream item.
class SelectProducer final : public IProducer {
public:
    SelectProducer(Producer upstream, Selector selector);
    std::optional<Value> next() override;

private:
    Producer upstream_;
    Selector selector_;
};

/// Calls a pull function for each item.
class PullProducer final : public IProducer {
public:
    explicit PullProducer(PullFunction pull);
    std::optional<Value> next() override;

private:
    PullFunction pull_;
};

/// Calls a Function value with no arguments for each item; nil ends.
class FunctionValueProducer final : public IProducer {
public:
    explicit FunctionValueProducer(Value function);
    std::optional<Value> next() override;

private:
    Value function_;
    bool done_ = false;
};

} // namespace lq::query::detail
