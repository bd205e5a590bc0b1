#include "tokenizer.hpp"

#include "staging_format.hpp"

#include <cstdint>
#include <unordered_set>
#include <utility>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace tmx_cwb {
namespace {

struct CodePoint {
    UChar32 value;  // negative for a byte that is not valid UTF-8
    std::size_t begin;
    std::size_t end;
};

using Span = std::pair<std::size_t, std::size_t>;

std::vector<CodePoint> decode_utf8(const std::string& text) {
    std::vector<CodePoint> out;
    out.reserve(text.size());

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t offset = 0;
    while (offset < length) {
        const int32_t begin = offset;
        UChar32 c = 0;
        U8_NEXT(bytes, offset, length, c);
        out.push_back(CodePoint{c, static_cast<std::size_t>(begin), static_cast<std::size_t>(offset)});
    }
    return out;
}

bool is_space(UChar32 c) {
    return c >= 0 && u_isUWhiteSpace(c);
}

bool is_detachable(UChar32 c) {
    return c >= 0 && (u_ispunct(c) || (U_GET_GC_MASK(c) & U_GC_S_MASK) != 0);
}

bool is_closing_punctuation(UChar32 c) {
    switch (c) {
    case '.': case ',': case ';': case ':': case '!': case '?':
    case ')': case ']': case '}': case '"': case '\'':
    case 0x00BB:  // right-pointing double angle quotation mark
        return true;
    default:
        return false;
    }
}

std::vector<Span> split_on_whitespace(const std::vector<CodePoint>& cps) {
    std::vector<Span> chunks;
    std::size_t i = 0;
    while (i < cps.size()) {
        while (i < cps.size() && is_space(cps[i].value)) {
            ++i;
        }
        const std::size_t first = i;
        while (i < cps.size() && !is_space(cps[i].value)) {
            ++i;
        }
        if (i > first) {
            chunks.emplace_back(first, i);
        }
    }
    return chunks;
}

std::string slice(const std::string& text, const std::vector<CodePoint>& cps, std::size_t first, std::size_t last) {
    return text.substr(cps[first].begin, cps[last - 1].end - cps[first].begin);
}

bool has_ascii_prefix_ci(const std::string& s, const char* prefix) {
    std::size_t i = 0;
    for (; prefix[i] != '\0'; ++i) {
        if (i >= s.size()) {
            return false;
        }
        char c = s[i];
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
        if (c != prefix[i]) {
            return false;
        }
    }
    return true;
}

bool looks_like_address(const std::string& chunk) {
    if (has_ascii_prefix_ci(chunk, "http://") || has_ascii_prefix_ci(chunk, "https://")
        || has_ascii_prefix_ci(chunk, "ftp://") || has_ascii_prefix_ci(chunk, "www.")) {
        return true;
    }
    const auto at = chunk.find('@');
    return at != std::string::npos && at > 0 && chunk.find('.', at + 1) != std::string::npos;
}

bool is_initials(const std::vector<CodePoint>& cps, std::size_t first, std::size_t last) {
    const std::size_t n = last - first;
    if (n < 2 || n % 2 != 0) {
        return false;
    }
    for (std::size_t i = first; i < last; i += 2) {
        if (cps[i].value < 0 || !u_isalpha(cps[i].value) || cps[i + 1].value != '.') {
            return false;
        }
    }
    return true;
}

bool is_abbreviation(const std::string& word) {
    static const std::unordered_set<std::string> abbreviations = {
        "sr.", "sra.", "srs.", "dr.", "dra.", "prof.", "profa.", "eng.", "exmo.", "exma.",
        "av.", "pág.", "págs.", "art.", "vol.", "fig.", "tel.", "sta.", "sto.",
        "etc.", "p.ex.", "e.g.", "i.e.", "cf.", "vs.", "approx.",
        "mr.", "mrs.", "ms.", "jr.", "inc.", "ltd."
    };
    return abbreviations.contains(to_lower_utf8(word));
}

void tokenize_chunk(
    const std::string& text,
    const std::vector<CodePoint>& cps,
    std::size_t first,
    std::size_t last,
    std::vector<std::string>& out
) {
    while (first < last && is_detachable(cps[first].value)) {
        std::size_t run_end = first + 1;
        while (run_end < last && cps[run_end].value == cps[first].value) {
            ++run_end;
        }
        out.push_back(slice(text, cps, first, run_end));
        first = run_end;
    }
    if (first == last) {
        return;
    }

    const bool address = looks_like_address(slice(text, cps, first, last));

    std::vector<std::string> trailing;
    while (first < last) {
        const UChar32 c = cps[last - 1].value;
        const bool detach = address ? is_closing_punctuation(c) : is_detachable(c);
        if (!detach) {
            break;
        }
        if (!address && c == '.') {
            if (is_initials(cps, first, last) || is_abbreviation(slice(text, cps, first, last))) {
                break;
            }
        }
        std::size_t run_begin = last - 1;
        while (run_begin > first && cps[run_begin - 1].value == c) {
            --run_begin;
        }
        trailing.push_back(slice(text, cps, run_begin, last));
        last = run_begin;
    }

    if (first < last) {
        out.push_back(slice(text, cps, first, last));
    }
    out.insert(out.end(), trailing.rbegin(), trailing.rend());
}

}  // namespace

std::unique_ptr<Tokenizer> Tokenizer::create(const std::string& name) {
    if (name == "whitespace") {
        return std::make_unique<WhitespaceTokenizer>();
    }
    if (name == "rule") {
        return std::make_unique<RuleTokenizer>();
    }
    return nullptr;
}

const char* Tokenizer::lists() {
    return "whitespace: split on runs of white space\n"
           "rule: detach punctuation, keep abbreviations, numbers and addresses\n";
}

std::vector<std::string> WhitespaceTokenizer::tokenize(const std::string& text) const {
    const auto cps = decode_utf8(text);

    std::vector<std::string> tokens;
    for (const auto& [first, last] : split_on_whitespace(cps)) {
        tokens.push_back(slice(text, cps, first, last));
    }
    return tokens;
}

std::vector<std::string> RuleTokenizer::tokenize(const std::string& text) const {
    const auto cps = decode_utf8(text);

    std::vector<std::string> tokens;
    for (const auto& [first, last] : split_on_whitespace(cps)) {
        tokenize_chunk(text, cps, first, last, tokens);
    }
    return tokens;
}

}  // namespace tmx_cwb
