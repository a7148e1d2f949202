#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "regexmap/rules/RegexOperation.h"

namespace regexmap::transform {

/**
 * Parameters handed to the module by its host at startup
 */
using TransformParams = std::unordered_map<std::string, std::string>;

// Parameter holding the JSON operation list
constexpr const char *SPEC_PARAM_NAME = "spec";

/**
 * Build the immutable operation list from the `spec` parameter
 *
 * Throws ConfigError if the parameter is missing or its value is not a
 * valid operation list.
 */
std::shared_ptr<const rules::OperationList> loadOperationsFromParams(
    const TransformParams &params);

}  // namespace regexmap::transform
