#pragma once

/// @file lq.hpp
/// @brief Aggregate header for the lazy query library.
///
/// Pulls in the value model, the object system, the query engine with
/// its source adapters, and the foundation layer (errors, logging,
/// configuration).

#include "lq/version.hpp"

#include "lq/core/key_value_pair.hpp"
#include "lq/core/result.hpp"
#include "lq/core/value.hpp"

#include "lq/foundation/config_manager.hpp"
#include "lq/foundation/error_code.hpp"
#include "lq/foundation/logging_config.hpp"
#include "lq/foundation/query_error.hpp"
#include "lq/foundation/query_logger.hpp"
#include "lq/foundation/query_result.hpp"

#include "lq/object/class.hpp"
#include "lq/object/object.hpp"

#include "lq/query/producer.hpp"
#include "lq/query/query.hpp"
#include "lq/query/sources.hpp"
