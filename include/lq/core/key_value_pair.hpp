#pragma once

/// @file key_value_pair.hpp
/// @brief Two-field record representing one mapping entry in a pipeline.

#include <optional>

#include "lq/core/value.hpp"

namespace lq {

/// One entry of a mapping while it flows through a query.
///
/// Produced by fromMapping() and consumed by Query::toMapping().  A pair
/// has no identity beyond its two fields.
struct KeyValuePair {
    Value key;
    Value value;

    friend bool operator==(const KeyValuePair& lhs, const KeyValuePair& rhs) {
        return lhs.key == rhs.key && lhs.value == rhs.value;
    }
};

/// Field names recognised on mapping-shaped records.
inline constexpr std::string_view kPairKeyField = "key";
inline constexpr std::string_view kPairValueField = "value";

/// Interpret @p item as a key/value pair.
///
/// Accepts a Pair value, or a Mapping holding a non-nil "key" entry (its
/// "value" entry, nil when missing, becomes the value).  Returns
/// std::nullopt for anything else, including pairs whose key is nil.
[[nodiscard]] std::optional<KeyValuePair> asKeyValuePair(const Value& item);

} // namespace lq
