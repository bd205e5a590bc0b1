#pragma once

#include <memory>
#include <string>
#include <vector>

namespace tmx_cwb {

class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    virtual std::vector<std::string> tokenize(const std::string& text) const = 0;
    virtual const char* algorithm() const = 0;

    // "whitespace" or "rule"; nullptr for anything else.
    static std::unique_ptr<Tokenizer> create(const std::string& name);
    static const char* lists();
};

// Splits on runs of Unicode white space.
class WhitespaceTokenizer final : public Tokenizer {
public:
    std::vector<std::string> tokenize(const std::string& text) const override;
    const char* algorithm() const override { return "whitespace"; }
};

// Word/punctuation tokenizer: detaches leading and trailing punctuation,
// keeps word-internal punctuation, URLs, e-mail addresses, initials and
// a closed list of abbreviations intact.
class RuleTokenizer final : public Tokenizer {
public:
    std::vector<std::string> tokenize(const std::string& text) const override;
    const char* algorithm() const override { return "rule"; }
};

}  // namespace tmx_cwb
