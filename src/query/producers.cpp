/// @file producers.cpp
/// @brief Producer implementations.

#include "producers.hpp"

#include "lq/core/key_value_pair.hpp"

namespace lq::query {

Producer makeProducer(PullFunction pull) {
    return std::make_unique<detail::PullProducer>(std::move(pull));
}

namespace detail {

// ---------------------------------------------------------------------------
// SequenceProducer
// ---------------------------------------------------------------------------
SequenceProducer::SequenceProducer(Value sequence) : sequence_(std::move(sequence)) {}

std::optional<Value> SequenceProducer::next() {
    const auto& items = sequence_.asSequence();
    if (index_ >= items.size()) {
        return std::nullopt;
    }
    return items[index_++];
}

// ---------------------------------------------------------------------------
// MappingProducer
// ---------------------------------------------------------------------------
MappingProducer::MappingProducer(Value mapping)
    : mapping_(std::move(mapping)), cursor_(mapping_.asMapping().begin()) {}

std::optional<Value> MappingProducer::next() {
    if (cursor_ == mapping_.asMapping().end()) {
        return std::nullopt;
    }
    const auto& [key, value] = *cursor_++;
    return Value(KeyValuePair{key, value});
}

// ---------------------------------------------------------------------------
// WhereProducer
// ---------------------------------------------------------------------------
WhereProducer::WhereProducer(Producer upstream, Predicate predicate)
    : upstream_(std::move(upstream)), predicate_(std::move(predicate)) {}

std::optional<Value> WhereProducer::next() {
    while (auto item = upstream_->next()) {
        if (predicate_(*item)) {
            return item;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// SelectProducer
// ---------------------------------------------------------------------------
SelectProducer::SelectProducer(Producer upstream, Selector selector)
    : upstream_(std::move(upstream)), selector_(std::move(selector)) {}

std::optional<Value> SelectProducer::next() {
    auto item = upstream_->next();
    if (!item) {
        return std::nullopt;
    }
    return selector_(*item);
}

// ---------------------------------------------------------------------------
// PullProducer
// ---------------------------------------------------------------------------
PullProducer::PullProducer(PullFunction pull) : pull_(std::move(pull)) {}

std::optional<Value> PullProducer::next() {
    if (!pull_) {
        return std::nullopt;
    }
    return pull_();
}

// ---------------------------------------------------------------------------
// FunctionValueProducer
// ---------------------------------------------------------------------------
FunctionValueProducer::FunctionValueProducer(Value function)
    : function_(std::move(function)), done_(!function_.isFunction()) {}

std::optional<Value> FunctionValueProducer::next() {
    if (done_) {
        return std::nullopt;
    }
    Value item = function_.call();
    if (item.isNil()) {
        // Once ended, stay ended even if the function would resume.
        done_ = true;
        return std::nullopt;
    }
    return item;
}

} // namespace detail
} // namespace lq::query
