/**
 * JsonMerge
 * Deep merge of JSON trees and insert-or-merge at a pointer path
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace regexmap::json {

/**
 * Deep merge `from` into `into`
 *
 * When both sides are objects every member of `from` is merged into the
 * member of `into` with the same key (created as null if missing), and
 * members only present in `into` are kept. In every other case `from`
 * replaces `into`: a scalar merged over an object discards the object, an
 * object merged over an array or string discards the old value.
 */
void mergeJson(nlohmann::json &into, nlohmann::json from);

/**
 * Insert or merge `value` at `path`, creating missing object levels
 *
 * - A path without any '/' is malformed and the document is left as is.
 * - If the path already resolves, `value` is merged into that node.
 * - Otherwise the last segment is peeled off, `value` is wrapped as
 *   {segment: value} and the parent path is tried, until a node resolves
 *   or no segments remain (then the wrapped value is merged into the root).
 *
 * Non-object content between the nearest resolvable ancestor and the leaf
 * is replaced: writing "/root/ccc" into {"root": [1, 2]} gives
 * {"root": {"ccc": value}}.
 */
void writeAtPath(nlohmann::json &document, const std::string &path,
                 nlohmann::json value);

}  // namespace regexmap::json
