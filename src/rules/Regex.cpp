#include "regexmap/rules/Regex.h"

#include <new>

#include "absl/strings/str_cat.h"
#include "regexmap/transform/TransformError.h"

namespace regexmap::rules {

using regexmap::transform::error_utils::createRecordError;
using regexmap::transform::error_utils::createRegexError;

namespace {

constexpr uint32_t COMPILE_OPTIONS =
    PCRE2_UTF | PCRE2_UCP | PCRE2_DOLLAR_ENDONLY;

std::string errorMessage(int error_code) {
    PCRE2_UCHAR buffer[256];
    int length = pcre2_get_error_message(error_code, buffer, sizeof(buffer));
    if (length < 0) {
        return absl::StrCat("PCRE2 error ", error_code);
    }
    return std::string(reinterpret_cast<const char *>(buffer), length);
}

struct MatchDataDeleter {
    void operator()(pcre2_match_data *data) const {
        pcre2_match_data_free(data);
    }
};

}  // namespace

Regex::Regex(const std::string &pattern) : pattern_(pattern) {
    int error_code = 0;
    PCRE2_SIZE error_offset = 0;
    code_.reset(pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern_.data()),
                              pattern_.size(), COMPILE_OPTIONS, &error_code,
                              &error_offset, nullptr));
    if (!code_) {
        throw createRegexError(
            pattern_, absl::StrCat(errorMessage(error_code), " at offset ",
                                   error_offset));
    }

    pcre2_pattern_info(code_.get(), PCRE2_INFO_CAPTURECOUNT, &group_count_);
}

int Regex::groupNumber(const std::string &name) const {
    int number = pcre2_substring_number_from_name(
        code_.get(), reinterpret_cast<PCRE2_SPTR>(name.c_str()));
    return number < 0 ? -1 : number;
}

bool Regex::search(const std::string &text, size_t start,
                   std::vector<GroupSpan> &groups) const {
    std::unique_ptr<pcre2_match_data, MatchDataDeleter> match_data(
        pcre2_match_data_create_from_pattern(code_.get(), nullptr));
    if (!match_data) {
        throw std::bad_alloc();
    }

    int rc = pcre2_match(code_.get(),
                         reinterpret_cast<PCRE2_SPTR>(text.data()),
                         text.size(), start, 0, match_data.get(), nullptr);
    if (rc == PCRE2_ERROR_NOMATCH) {
        return false;
    }
    if (rc < 0) {
        throw createRecordError(
            "regex matching",
            absl::StrCat(errorMessage(rc), " for pattern '", pattern_, "'"));
    }

    const PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(match_data.get());
    groups.assign(group_count_ + 1,
                  GroupSpan(std::string::npos, std::string::npos));
    for (uint32_t i = 0; i <= group_count_; i++) {
        PCRE2_SIZE begin = ovector[2 * i];
        PCRE2_SIZE end = ovector[2 * i + 1];
        if (begin == PCRE2_UNSET) {
            continue;
        }
        groups[i] = GroupSpan(begin, end);
    }
    return true;
}

}  // namespace regexmap::rules
