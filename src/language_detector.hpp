#pragma once

#include "errors.hpp"
#include "translation_unit.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tmx_cwb {

// Picks the (source, target) pair from the languages a TMX document
// declares, in declared order. Empty hints count as absent.
bool resolve_language_pair(
    const std::vector<std::string>& available,
    const std::optional<std::string>& from_hint,
    const std::optional<std::string>& to_hint,
    LanguagePair& out_pair,
    Error& error
);

}  // namespace tmx_cwb
