#include "staging_format.hpp"

#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace tmx_cwb {

std::string sanitize_corpus_base(const std::string& raw) {
    std::string out = raw;
    for (char& c : out) {
        if (c == '.' || c == '-') {
            c = '_';
        }
    }
    return out;
}

std::string to_lower_utf8(const std::string& text) {
    std::string out;
    icu::UnicodeString::fromUTF8(text).toLower(icu::Locale::getRoot()).toUTF8String(out);
    return out;
}

std::string to_upper_utf8(const std::string& text) {
    std::string out;
    icu::UnicodeString::fromUTF8(text).toUpper(icu::Locale::getRoot()).toUTF8String(out);
    return out;
}

std::string corpus_name(const std::string& base, const std::string& lang) {
    return to_lower_utf8(base + "_" + lang);
}

std::string corpus_id(const std::string& base, const std::string& lang) {
    return to_upper_utf8(base + "_" + lang);
}

std::string escape_markup(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '<') {
            out += "&lt";
        } else if (c == '>') {
            out += "&gt";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string format_staging_block(std::size_t tu_id, const std::vector<std::string>& tokens) {
    std::string out = "<";
    out += kStagingRegion;
    out += " ";
    out += kStagingRegionAttribute;
    out += "='" + std::to_string(tu_id) + "'>\n";
    for (const auto& token : tokens) {
        out += token;
        out.push_back('\n');
    }
    out += "</";
    out += kStagingRegion;
    out += ">\n";
    return out;
}

std::string format_alignment_header(const std::string& source_id, const std::string& target_id) {
    return source_id + "\t" + target_id + "\t" + kStagingRegion + "\t" + kStagingRegionAttribute + "_{"
        + kStagingRegionAttribute + "}\n";
}

std::string format_alignment_record(std::size_t tu_id) {
    const std::string key = std::string(kStagingRegionAttribute) + "_" + std::to_string(tu_id);
    return key + "\t" + key + "\n";
}

}  // namespace tmx_cwb
