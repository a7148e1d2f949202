/**
 * RegexOperation
 * Configured regex operations and their evaluation against field text
 */

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "regexmap/rules/Regex.h"

namespace regexmap::rules {

/**
 * Extract capture group 1 of `regex` from the field at `target` and store
 * it at `output`
 */
struct CaptureOperation {
    std::shared_ptr<const Regex> regex;
    std::string target;
    std::string output;
};

/**
 * Replace every match of `regex` in the field at `target` with the `with`
 * template and store the result back at `target`
 */
struct ReplaceOperation {
    std::shared_ptr<const Regex> regex;
    std::string target;
    std::string with;
};

using Operation = std::variant<CaptureOperation, ReplaceOperation>;
using OperationList = std::vector<Operation>;

/**
 * Compile a pattern, throwing ConfigError if it is not a valid regex
 */
std::shared_ptr<const Regex> compileRegex(const std::string &pattern);

CaptureOperation makeCapture(const std::string &pattern,
                             const std::string &target,
                             const std::string &output);

ReplaceOperation makeReplace(const std::string &pattern,
                             const std::string &target,
                             const std::string &with);

/**
 * Path the operation reads its input text from
 */
const std::string &sourcePath(const Operation &operation);

/**
 * Path the operation writes its result to (the source path for replace)
 */
const std::string &destinationPath(const Operation &operation);

/**
 * Operation variant name as used in configuration ("capture" / "replace")
 */
std::string operationName(const Operation &operation);

/**
 * Search `text` and return capture group 1
 *
 * Returns the empty string when nothing matches, when the pattern has no
 * group, or when group 1 did not participate in the match.
 */
std::string captureFirstGroup(const Regex &regex, const std::string &text);

/**
 * Replace all non-overlapping matches of `regex` in `text`
 *
 * The replacement is a template: $N or ${N} inserts group N, $name or
 * ${name} inserts a named group and $$ inserts a literal '$'. Groups that
 * are unknown or did not participate expand to nothing. Text without a
 * match is returned unchanged.
 */
std::string replaceAll(const Regex &regex, const std::string &text,
                       const std::string &replacement);

/**
 * Run the operation against a field value
 */
std::string runOperation(const Operation &operation, const std::string &text);

}  // namespace regexmap::rules
