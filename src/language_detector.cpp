#include "language_detector.hpp"

#include <algorithm>

namespace tmx_cwb {
namespace {

std::optional<std::string> normalize_hint(const std::optional<std::string>& hint) {
    if (!hint || hint->empty()) {
        return std::nullopt;
    }
    return hint;
}

bool is_available(const std::vector<std::string>& available, const std::string& lang) {
    return std::find(available.begin(), available.end(), lang) != available.end();
}

std::string other_language(const std::vector<std::string>& available, const std::string& lang) {
    for (const auto& candidate : available) {
        if (candidate != lang) {
            return candidate;
        }
    }
    return {};
}

}  // namespace

bool resolve_language_pair(
    const std::vector<std::string>& available,
    const std::optional<std::string>& from_hint,
    const std::optional<std::string>& to_hint,
    LanguagePair& out_pair,
    Error& error
) {
    const auto from = normalize_hint(from_hint);
    const auto to = normalize_hint(to_hint);

    if (from && !is_available(available, *from)) {
        return fail(error, ErrorCode::UnavailableLanguage, "Language " + *from + " not available");
    }
    if (to && !is_available(available, *to)) {
        return fail(error, ErrorCode::UnavailableLanguage, "Language " + *to + " not available");
    }

    if (from && to) {
        if (*from == *to) {
            return fail(error, ErrorCode::AmbiguousLanguagePair,
                "Source and target language are both " + *from);
        }
        out_pair = LanguagePair{*from, *to};
        return true;
    }

    if (available.size() == 2 && available[0] != available[1]) {
        if (from) {
            out_pair = LanguagePair{*from, other_language(available, *from)};
        } else if (to) {
            out_pair = LanguagePair{other_language(available, *to), *to};
        } else {
            out_pair = LanguagePair{available[0], available[1]};
        }
        return true;
    }

    return fail(error, ErrorCode::AmbiguousLanguagePair,
        "Can't guess what languages to use among " + std::to_string(available.size()) + " languages");
}

}  // namespace tmx_cwb
