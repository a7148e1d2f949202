/**
 * OperationConfig
 * Decoding of the operation list configuration
 *
 * The configuration is a JSON array, one element per operation:
 *
 *   [
 *     {"capture": {"regex": "(?i)Second:\\s+(\\w+)\\b",
 *                  "target": "/description",
 *                  "output": "/parsed/second"}},
 *     {"replace": {"regex": "\\d{3}-\\d{2}-\\d{4}",
 *                  "target": "/name/ssn",
 *                  "with": "***-**-****"}}
 *   ]
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "regexmap/rules/RegexOperation.h"

namespace regexmap::rules {

// Variant keys of a configuration element
constexpr const char *CAPTURE_KEY = "capture";
constexpr const char *REPLACE_KEY = "replace";

void from_json(const nlohmann::json &j, CaptureOperation &o);
void from_json(const nlohmann::json &j, ReplaceOperation &o);

/**
 * Decode a single configuration element ({"capture": {...}} or
 * {"replace": {...}})
 */
Operation parseOperation(const nlohmann::json &spec);

/**
 * Decode an already parsed operation list
 */
OperationList loadOperations(const nlohmann::json &spec);

/**
 * Parse and decode an operation list from JSON text
 *
 * Throws ConfigError if the text is not JSON, is not an array of
 * operations, or holds a pattern that does not compile.
 */
OperationList parseOperations(const std::string &spec_text);

}  // namespace regexmap::rules
