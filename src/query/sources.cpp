/// @file sources.cpp
/// @brief Source adapters and shape detection.

#include "lq/query/sources.hpp"

#include <string>

#include "lq/foundation/query_logger.hpp"
#include "producers.hpp"

namespace lq::query {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::QueryError;
using foundation::QueryResult;

namespace {

QueryError shapeError(ErrorCode code, std::string_view expected, const Value& actual) {
    return QueryError(code,
                      "expected " + std::string(expected) + ", got " +
                          std::string(valueKindName(actual.kind())),
                      actual.kind());
}

// Sequence with a nil (or missing) first slot.
bool isSparseSequence(const Value& source) {
    const auto& items = source.asSequence();
    return items.empty() || items.front().isNil();
}

// 1-based index -> element, without the nil slots.
Value indexSequence(const Value& source) {
    Mapping entries;
    int64_t index = 1;
    for (const auto& item : source.asSequence()) {
        if (!item.isNil()) {
            entries.emplace(Value(index), item);
        }
        ++index;
    }
    return Value(std::move(entries));
}

// Traversal over a dynamic factory: one call yields the producer function.
Producer openFunctionProducer(const Value& factory) {
    Value producer = factory.call();
    if (!producer.isFunction()) {
        LQ_LOG_WARN(LogCategory::Source,
                    "producer factory returned " +
                        std::string(valueKindName(producer.kind())) +
                        " instead of a function; treating source as empty");
    }
    return std::make_unique<detail::FunctionValueProducer>(std::move(producer));
}

} // namespace

QueryResult<SourceOptions> loadSourceOptions(const ConfigManager& config) {
    SourceOptions options;
    auto sparse = config.getOr<bool>(kSparseSequenceAsMappingKey, options.sparseSequenceAsMapping);
    if (sparse.hasError()) {
        return QueryResult<SourceOptions>::err(sparse.error());
    }
    options.sparseSequenceAsMapping = sparse.value();
    return QueryResult<SourceOptions>::ok(options);
}

QueryResult<Query> fromSequence(const Value& sequence) {
    if (!sequence.isSequence()) {
        auto error = shapeError(ErrorCode::ExpectedSequence, "sequence", sequence);
        LQ_LOG_DEBUG(LogCategory::Source, "fromSequence: " + error.describe());
        return QueryResult<Query>::err(std::move(error));
    }
    return Query::create([sequence]() -> Producer {
        return std::make_unique<detail::SequenceProducer>(sequence);
    });
}

QueryResult<Query> fromMapping(const Value& mapping) {
    if (!mapping.isMapping()) {
        auto error = shapeError(ErrorCode::ExpectedMapping, "mapping", mapping);
        LQ_LOG_DEBUG(LogCategory::Source, "fromMapping: " + error.describe());
        return QueryResult<Query>::err(std::move(error));
    }
    return Query::create([mapping]() -> Producer {
        return std::make_unique<detail::MappingProducer>(mapping);
    });
}

QueryResult<Query> fromProducer(ProducerFactory factory) {
    return Query::create(std::move(factory));
}

QueryResult<Query> fromFunction(const Value& factory) {
    if (!factory.isFunction()) {
        auto error = shapeError(ErrorCode::ExpectedProducerFunction, "producer function", factory);
        LQ_LOG_DEBUG(LogCategory::Source, "fromFunction: " + error.describe());
        return QueryResult<Query>::err(std::move(error));
    }
    return Query::create([factory]() { return openFunctionProducer(factory); });
}

Query fromNone() {
    // An empty sequence is always accepted.
    return fromSequence(Value(Sequence{})).value();
}

Query from(const Value& source, const SourceOptions& options) {
    if (auto existing = Query::fromValue(source)) {
        return *existing;
    }

    QueryResult<Query> adapted = QueryResult<Query>::ok(fromNone());
    switch (source.kind()) {
        case ValueKind::Sequence:
            if (options.sparseSequenceAsMapping && isSparseSequence(source)) {
                adapted = fromMapping(indexSequence(source));
            } else {
                adapted = fromSequence(source);
            }
            break;
        case ValueKind::Mapping:
            adapted = fromMapping(source);
            break;
        case ValueKind::Function:
            adapted = fromFunction(source);
            break;
        default:
            LQ_LOG_DEBUG(LogCategory::Source,
                         "from() wrapped " + std::string(valueKindName(source.kind())) +
                             " as an empty source");
            break;
    }

    // Each branch checked the shape it dispatched on.
    return adapted.hasValue() ? std::move(adapted).value() : fromNone();
}

Query from(ProducerFactory factory) {
    auto adapted = fromProducer(std::move(factory));
    return adapted.hasValue() ? std::move(adapted).value() : fromNone();
}

} // namespace lq::query
