/**
 * JsonPointer
 * Pointer-path lookups into JSON documents
 */

#pragma once

#include <string>

#include "absl/strings/string_view.h"
#include <nlohmann/json.hpp>

namespace regexmap::json {

/**
 * Decode a single pointer segment ("~1" -> "/", "~0" -> "~")
 */
std::string unescapeToken(absl::string_view token);

/**
 * Resolve a pointer path against a document
 *
 * An empty path refers to the whole document. Any other path must start
 * with '/'. Each segment selects an object member by key or an array
 * element by decimal index.
 *
 * @param document The document to search
 * @param path The pointer path, e.g. "/name/first" or "/items/0"
 * @return The addressed value, or nullptr if the path does not resolve
 */
const nlohmann::json *resolvePointer(const nlohmann::json &document,
                                     const std::string &path);

/**
 * Mutable variant of resolvePointer, used to locate a sub-tree for writing
 */
nlohmann::json *resolvePointer(nlohmann::json &document,
                               const std::string &path);

/**
 * Read the value at a pointer path as text
 *
 * Strings are returned verbatim, every other value as its compact JSON
 * text. A path that does not resolve yields the empty string.
 */
std::string readField(const nlohmann::json &document, const std::string &path);

}  // namespace regexmap::json
