#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tmx_cwb {

// Corpus naming. The lower-case form names the data folder and registry
// entry, the upper-case form is the CWB corpus id.
std::string sanitize_corpus_base(const std::string& raw);
std::string corpus_name(const std::string& base, const std::string& lang);
std::string corpus_id(const std::string& base, const std::string& lang);

std::string to_lower_utf8(const std::string& text);
std::string to_upper_utf8(const std::string& text);

// Replaces '<' with "&lt" and '>' with "&gt". Nothing else is touched.
std::string escape_markup(const std::string& text);

std::string format_staging_block(std::size_t tu_id, const std::vector<std::string>& tokens);
std::string format_alignment_header(const std::string& source_id, const std::string& target_id);
std::string format_alignment_record(std::size_t tu_id);

constexpr const char* kStagingRegion = "tu";
constexpr const char* kStagingRegionAttribute = "id";

}  // namespace tmx_cwb
