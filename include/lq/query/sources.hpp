#pragma once

/// @file sources.hpp
/// @brief Source adapters turning host data into queries.

#include "lq/core/value.hpp"
#include "lq/foundation/config_manager.hpp"
#include "lq/foundation/query_result.hpp"
#include "lq/query/producer.hpp"
#include "lq/query/query.hpp"

namespace lq::query {

/// Config key for SourceOptions::sparseSequenceAsMapping.
inline constexpr std::string_view kSparseSequenceAsMappingKey =
    "source.sparse_sequence_as_mapping";

/// Tuning for the auto-detecting from().
struct SourceOptions {
    /// Treat a sequence whose first slot is nil (or that is empty) as a
    /// mapping of 1-based index to element, skipping nil elements.
    ///
    /// Off by default; enable only for callers that depend on that legacy
    /// classification of sparse sequences.
    bool sparseSequenceAsMapping = false;
};

/// Read SourceOptions from @p config; absent keys keep their defaults.
/// @return The options, or ConfigTypeMismatch.
foundation::QueryResult<SourceOptions> loadSourceOptions(const foundation::ConfigManager& config);

/// Query yielding the elements of a Sequence value in index order.
/// @return The query, or ExpectedSequence.
foundation::QueryResult<Query> fromSequence(const Value& sequence);

/// Query yielding one Pair per entry of a Mapping value.
/// Entry order is unspecified.
/// @return The query, or ExpectedMapping.
foundation::QueryResult<Query> fromMapping(const Value& mapping);

/// Query over an existing producer factory.
/// @return The query, or ExpectedProducerFunction if @p factory is empty.
foundation::QueryResult<Query> fromProducer(ProducerFactory factory);

/// Query over a dynamic producer factory.
///
/// @p factory is a Function value; each traversal calls it with no
/// arguments to obtain a producer function, which is then called once
/// per item until it returns nil.  A factory returning a non-function
/// yields an empty traversal.
///
/// @return The query, or ExpectedProducerFunction for a non-function.
foundation::QueryResult<Query> fromFunction(const Value& factory);

/// The empty query.
[[nodiscard]] Query fromNone();

/// Wrap any value, detecting its shape.
///
/// | @p source                | Result                    |
/// |--------------------------|---------------------------|
/// | a query object           | that same query           |
/// | Sequence                 | fromSequence(source)      |
/// | Mapping                  | fromMapping(source)       |
/// | Function                 | fromFunction(source)      |
/// | anything else            | fromNone()                |
[[nodiscard]] Query from(const Value& source, const SourceOptions& options = {});

/// Identity wrap for an existing query.
[[nodiscard]] inline Query from(const Query& source) { return source; }

/// Wrap a producer factory; an empty factory yields fromNone().
[[nodiscard]] Query from(ProducerFactory factory);

} // namespace lq::query
