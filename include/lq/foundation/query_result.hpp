#pragma once

/// @file query_result.hpp
/// @brief QueryResult<T> alias used by every fallible library call.

#include "lq/core/result.hpp"
#include "lq/foundation/query_error.hpp"

namespace lq::foundation {

/// Result type specialized with QueryError.
///
/// Source adapters, query operators, the object system and the config
/// layer return QueryResult<T> instead of throwing.
///
/// Example:
/// @code
///   QueryResult<Query> evens(const Query& q) {
///       return q.where([](const Value& v) {
///           return v.isInteger() && v.asInteger() % 2 == 0;
///       });
///   }
/// @endcode
template <typename T>
using QueryResult = lq::Result<T, QueryError>;

}  // namespace lq::foundation
