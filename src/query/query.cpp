/// @file query.cpp
/// @brief Query construction, lazy operators and terminal evaluation.

#include "lq/query/query.hpp"

#include <string>

#include "lq/core/key_value_pair.hpp"
#include "lq/foundation/query_logger.hpp"
#include "lq/object/object.hpp"
#include "producers.hpp"

namespace lq::query {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::QueryError;
using foundation::QueryLogger;
using foundation::QueryResult;

namespace {

QueryError missingPredicate(const char* operation) {
    return QueryError(ErrorCode::ExpectedPredicate,
                      std::string("expected predicate function for ") + operation);
}

// Invoke @p factory; a factory handing back nothing behaves as an empty source.
Producer openProducer(const ProducerFactory& factory) {
    Producer producer = factory();
    if (!producer) {
        LQ_LOG_WARN(LogCategory::Query, "producer factory returned no producer");
        return makeProducer(PullFunction());
    }
    return producer;
}

} // namespace

const object::ClassRef& Query::klass() {
    static const object::ClassRef cls = object::Class::make("Queryable");
    return cls;
}

Query::Query(ObjectRef object, const ProducerFactory* factory)
    : object_(std::move(object)), factory_(factory) {}

QueryResult<Query> Query::create(ProducerFactory factory) {
    if (!factory) {
        return QueryResult<Query>::err(
            QueryError(ErrorCode::ExpectedProducerFunction, "expected producer function"));
    }

    auto instance = klass()->instantiateWith(std::move(factory));
    if (instance.hasError()) {
        return QueryResult<Query>::err(instance.error());
    }

    ObjectRef object = std::move(instance).value();
    const auto* stored = object->native<ProducerFactory>();
    return QueryResult<Query>::ok(Query(std::move(object), stored));
}

std::optional<Query> Query::fromValue(const Value& value) {
    if (!klass()->classOf(value)) {
        return std::nullopt;
    }
    const ObjectRef& object = value.asObject();
    const auto* factory = object->native<ProducerFactory>();
    if (factory == nullptr || !*factory) {
        return std::nullopt;
    }
    return Query(object, factory);
}

// ---------------------------------------------------------------------------
// Lazy operators
// ---------------------------------------------------------------------------

QueryResult<Query> Query::where(Predicate predicate) const {
    if (!predicate) {
        return QueryResult<Query>::err(missingPredicate("where"));
    }
    // Capture the upstream factory by value: the new query must not
    // depend on this handle staying alive.
    return create([upstream = *factory_, predicate = std::move(predicate)]() -> Producer {
        return std::make_unique<detail::WhereProducer>(openProducer(upstream), predicate);
    });
}

QueryResult<Query> Query::select(Selector selector) const {
    if (!selector) {
        return QueryResult<Query>::err(
            QueryError(ErrorCode::ExpectedSelector, "expected selector function for select"));
    }
    return create([upstream = *factory_, selector = std::move(selector)]() -> Producer {
        return std::make_unique<detail::SelectProducer>(openProducer(upstream), selector);
    });
}

// ---------------------------------------------------------------------------
// Terminal operators
// ---------------------------------------------------------------------------

Producer Query::toProducer() const {
    return openProducer(*factory_);
}

Sequence Query::toSequence() const {
    Sequence items;
    auto producer = toProducer();
    drain(*producer, [&](Value& item) {
        items.push_back(std::move(item));
        return true;
    });
    return items;
}

Mapping Query::toMapping() const {
    Mapping entries;
    auto producer = toProducer();
    std::size_t index = 0;
    auto& logger = QueryLogger::instance();

    drain(*producer, [&](const Value& item) {
        if (auto pair = asKeyValuePair(item)) {
            entries.insert_or_assign(std::move(pair->key), std::move(pair->value));
        } else if (logger.isEnabled(LogLevel::Trace, LogCategory::Query)) {
            LogContext ctx;
            ctx.operation = "toMapping";
            ctx.itemIndex = index;
            ctx.extra["kind"] = std::string(valueKindName(item.kind()));
            logger.logWithContext(LogLevel::Trace, LogCategory::Query,
                                  "Skipped item that is not a key/value pair", ctx);
        }
        ++index;
        return true;
    });
    return entries;
}

std::optional<Value> Query::first() const {
    return toProducer()->next();
}

Value Query::firstOrNone() const {
    auto item = first();
    return item ? std::move(*item) : Value();
}

QueryResult<bool> Query::all(const Predicate& predicate) const {
    if (!predicate) {
        return QueryResult<bool>::err(missingPredicate("all"));
    }
    bool result = true;
    auto producer = toProducer();
    drain(*producer, [&](const Value& item) {
        if (!predicate(item)) {
            result = false;
        }
        return result;
    });
    return QueryResult<bool>::ok(result);
}

QueryResult<bool> Query::any(const Predicate& predicate) const {
    if (!predicate) {
        return QueryResult<bool>::err(missingPredicate("any"));
    }
    bool result = false;
    auto producer = toProducer();
    drain(*producer, [&](const Value& item) {
        if (predicate(item)) {
            result = true;
        }
        return !result;
    });
    return QueryResult<bool>::ok(result);
}

} // namespace lq::query
