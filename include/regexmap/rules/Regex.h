/**
 * Regex
 * Compiled PCRE2 pattern with Unicode-aware character classes
 */

#pragma once

#ifndef PCRE2_CODE_UNIT_WIDTH
#define PCRE2_CODE_UNIT_WIDTH 8
#endif
#include <pcre2.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace regexmap::rules {

/**
 * Byte offsets [begin, end) of a capture group within the searched text.
 * Groups that did not participate hold {npos, npos}.
 */
using GroupSpan = std::pair<size_t, size_t>;

/**
 * A pattern compiled once and matched against UTF-8 text
 *
 * Patterns are compiled in UTF mode with Unicode properties, so `\w`, `\d`,
 * `\s` and `\b` cover non-ASCII letters, digits and spaces, and `(?i)` folds
 * case across scripts. `$` only matches at the very end of the text.
 *
 * The compiled code is read-only after construction and may be shared
 * between threads; every search allocates its own match data.
 */
class Regex {
  public:
    /**
     * Compile `pattern`, throwing ConfigError if it is not a valid regex
     */
    explicit Regex(const std::string &pattern);

    const std::string &pattern() const { return pattern_; }

    // Number of capturing groups, not counting the whole match
    uint32_t groupCount() const { return group_count_; }

    /**
     * Group number for a named group, or -1 if the pattern has no such name
     */
    int groupNumber(const std::string &name) const;

    /**
     * Find the leftmost match starting at or after byte offset `start`
     *
     * On success `groups` holds groupCount() + 1 spans, the whole match
     * first. Throws RecordError if the engine gives up on the text (invalid
     * UTF-8, match limit exceeded).
     */
    bool search(const std::string &text, size_t start,
                std::vector<GroupSpan> &groups) const;

  private:
    struct CodeDeleter {
        void operator()(pcre2_code *code) const { pcre2_code_free(code); }
    };

    std::string pattern_;
    std::unique_ptr<pcre2_code, CodeDeleter> code_;
    uint32_t group_count_ = 0;
};

}  // namespace regexmap::rules
