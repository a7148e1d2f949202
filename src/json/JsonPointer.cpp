#include "regexmap/json/JsonPointer.h"

#include <cstddef>
#include <optional>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"

namespace regexmap::json {

namespace {

// Decimal array index without sign or leading zeros
std::optional<size_t> parseArrayIndex(absl::string_view token) {
    if (token.empty() || (token.size() > 1 && token[0] == '0')) {
        return std::nullopt;
    }
    for (char c : token) {
        if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    size_t index = 0;
    if (!absl::SimpleAtoi(token, &index)) {
        return std::nullopt;  // overflow
    }
    return index;
}

template <typename JsonT>
JsonT *resolveImpl(JsonT &document, const std::string &path) {
    if (path.empty()) {
        return &document;
    }
    if (path.front() != '/') {
        return nullptr;
    }

    JsonT *current = &document;
    absl::string_view tail = absl::string_view(path).substr(1);
    for (absl::string_view raw_token : absl::StrSplit(tail, '/')) {
        std::string token = unescapeToken(raw_token);

        if (current->is_object()) {
            auto it = current->find(token);
            if (it == current->end()) {
                return nullptr;
            }
            current = &(*it);
        } else if (current->is_array()) {
            auto index = parseArrayIndex(token);
            if (!index.has_value() || index.value() >= current->size()) {
                return nullptr;
            }
            current = &(*current)[index.value()];
        } else {
            // Scalars have no children
            return nullptr;
        }
    }

    return current;
}

}  // namespace

std::string unescapeToken(absl::string_view token) {
    return absl::StrReplaceAll(token, {{"~1", "/"}, {"~0", "~"}});
}

const nlohmann::json *resolvePointer(const nlohmann::json &document,
                                     const std::string &path) {
    return resolveImpl(document, path);
}

nlohmann::json *resolvePointer(nlohmann::json &document,
                               const std::string &path) {
    return resolveImpl(document, path);
}

std::string readField(const nlohmann::json &document,
                      const std::string &path) {
    const nlohmann::json *value = resolvePointer(document, path);
    if (value == nullptr) {
        return "";
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    return value->dump();
}

}  // namespace regexmap::json
