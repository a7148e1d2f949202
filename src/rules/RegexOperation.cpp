#include "regexmap/rules/RegexOperation.h"

#include <cstddef>
#include <optional>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"

namespace regexmap::rules {

namespace {

// Reference to a capture group inside a replacement template
struct GroupReference {
    std::string name;
    size_t end;  // index just past the reference
};

bool isGroupNameChar(char c) {
    return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/**
 * Parse "$name", "$N" or "${...}" starting at the '$' at `pos`
 */
std::optional<GroupReference> parseGroupReference(
    const std::string &replacement, size_t pos) {
    size_t start = pos + 1;
    if (start < replacement.size() && replacement[start] == '{') {
        size_t close = replacement.find('}', start + 1);
        // "${" without a closing brace and "${}" are literal text
        if (close == std::string::npos || close == start + 1) {
            return std::nullopt;
        }
        return GroupReference{
            replacement.substr(start + 1, close - start - 1), close + 1};
    }

    size_t end = start;
    while (end < replacement.size() && isGroupNameChar(replacement[end])) {
        end++;
    }
    if (end == start) {
        return std::nullopt;
    }
    return GroupReference{replacement.substr(start, end - start), end};
}

void appendGroup(const Regex &regex, const std::string &text,
                 const std::vector<GroupSpan> &groups,
                 const std::string &name, std::string *out) {
    int index = -1;
    bool numeric = !name.empty();
    for (char c : name) {
        numeric = numeric && absl::ascii_isdigit(static_cast<unsigned char>(c));
    }

    if (numeric) {
        if (!absl::SimpleAtoi(name, &index)) {
            return;
        }
    } else {
        index = regex.groupNumber(name);
    }

    if (index < 0 || static_cast<size_t>(index) >= groups.size()) {
        return;
    }
    const GroupSpan &group = groups[index];
    if (group.first != std::string::npos) {
        out->append(text, group.first, group.second - group.first);
    }
}

void expandTemplate(const Regex &regex, const std::string &text,
                    const std::vector<GroupSpan> &groups,
                    const std::string &replacement, std::string *out) {
    size_t i = 0;
    while (i < replacement.size()) {
        size_t dollar = replacement.find('$', i);
        if (dollar == std::string::npos) {
            out->append(replacement, i, std::string::npos);
            return;
        }
        out->append(replacement, i, dollar - i);

        if (dollar + 1 < replacement.size() && replacement[dollar + 1] == '$') {
            out->push_back('$');
            i = dollar + 2;
            continue;
        }

        auto reference = parseGroupReference(replacement, dollar);
        if (!reference.has_value()) {
            out->push_back('$');
            i = dollar + 1;
            continue;
        }

        appendGroup(regex, text, groups, reference->name, out);
        i = reference->end;
    }
}

// Offset of the code point after the one starting at `pos`
size_t nextCodePoint(const std::string &text, size_t pos) {
    if (pos >= text.size()) {
        return text.size() + 1;
    }
    pos++;
    while (pos < text.size() &&
           (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        pos++;
    }
    return pos;
}

}  // namespace

std::shared_ptr<const Regex> compileRegex(const std::string &pattern) {
    return std::make_shared<const Regex>(pattern);
}

CaptureOperation makeCapture(const std::string &pattern,
                             const std::string &target,
                             const std::string &output) {
    return CaptureOperation{compileRegex(pattern), target, output};
}

ReplaceOperation makeReplace(const std::string &pattern,
                             const std::string &target,
                             const std::string &with) {
    return ReplaceOperation{compileRegex(pattern), target, with};
}

const std::string &sourcePath(const Operation &operation) {
    return std::visit(
        [](const auto &op) -> const std::string & { return op.target; },
        operation);
}

const std::string &destinationPath(const Operation &operation) {
    if (const auto *capture = std::get_if<CaptureOperation>(&operation)) {
        return capture->output;
    }
    return std::get<ReplaceOperation>(operation).target;
}

std::string operationName(const Operation &operation) {
    return std::holds_alternative<CaptureOperation>(operation) ? "capture"
                                                               : "replace";
}

std::string captureFirstGroup(const Regex &regex, const std::string &text) {
    if (regex.groupCount() < 1) {
        return "";
    }

    std::vector<GroupSpan> groups;
    if (!regex.search(text, 0, groups)) {
        return "";
    }
    const GroupSpan &group = groups[1];
    if (group.first == std::string::npos) {
        return "";
    }
    return text.substr(group.first, group.second - group.first);
}

std::string replaceAll(const Regex &regex, const std::string &text,
                       const std::string &replacement) {
    std::vector<GroupSpan> groups;

    std::string result;
    bool replaced = false;
    size_t copied_until = 0;
    size_t search_pos = 0;
    std::optional<size_t> last_match_end;

    while (search_pos <= text.size()) {
        if (!regex.search(text, search_pos, groups)) {
            break;
        }

        size_t match_start = groups[0].first;
        size_t match_end = groups[0].second;

        // An empty match right where the previous match ended is not counted
        if (match_start == match_end && last_match_end.has_value() &&
            last_match_end.value() == match_start) {
            search_pos = nextCodePoint(text, match_start);
            continue;
        }

        result.append(text, copied_until, match_start - copied_until);
        expandTemplate(regex, text, groups, replacement, &result);
        copied_until = match_end;
        last_match_end = match_end;
        replaced = true;

        search_pos = match_start == match_end ? nextCodePoint(text, match_end)
                                              : match_end;
    }

    if (!replaced) {
        return text;
    }
    result.append(text, copied_until, std::string::npos);
    return result;
}

std::string runOperation(const Operation &operation, const std::string &text) {
    if (const auto *capture = std::get_if<CaptureOperation>(&operation)) {
        return captureFirstGroup(*capture->regex, text);
    }
    const auto &replace = std::get<ReplaceOperation>(operation);
    return replaceAll(*replace.regex, text, replace.with);
}

}  // namespace regexmap::rules
