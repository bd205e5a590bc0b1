#include <gtest/gtest.h>

#include "tokenizer.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace tmx_cwb;

using Tokens = std::vector<std::string>;

class RuleTokenizerTest : public ::testing::Test {
protected:
    Tokens tok(const std::string& text) const { return tokenizer_.tokenize(text); }

    RuleTokenizer tokenizer_;
};

TEST(TokenizerFactoryTest, CreatesKnownAlgorithms) {
    const auto ws = Tokenizer::create("whitespace");
    ASSERT_NE(ws, nullptr);
    EXPECT_STREQ(ws->algorithm(), "whitespace");

    const auto rule = Tokenizer::create("rule");
    ASSERT_NE(rule, nullptr);
    EXPECT_STREQ(rule->algorithm(), "rule");

    EXPECT_EQ(Tokenizer::create("moses"), nullptr);
}

TEST(TokenizerFactoryTest, ListedNamesCanBeCreated) {
    std::istringstream listing(Tokenizer::lists());
    std::string line;
    std::vector<std::string> names;
    while (std::getline(listing, line)) {
        const auto colon = line.find(':');
        ASSERT_NE(colon, std::string::npos) << line;
        names.push_back(line.substr(0, colon));
    }

    EXPECT_EQ(names, (Tokens{"whitespace", "rule"}));
    for (const auto& name : names) {
        const auto tokenizer = Tokenizer::create(name);
        ASSERT_NE(tokenizer, nullptr) << name;
        EXPECT_EQ(tokenizer->algorithm(), name);
    }
}

TEST(WhitespaceTokenizerTest, SplitsOnWhitespaceRuns) {
    WhitespaceTokenizer tokenizer;
    EXPECT_EQ(tokenizer.tokenize("  a\tb\n c  "), (Tokens{"a", "b", "c"}));
    EXPECT_EQ(tokenizer.tokenize("Olá, mundo!"), (Tokens{"Olá,", "mundo!"}));
    EXPECT_TRUE(tokenizer.tokenize("   ").empty());
    EXPECT_TRUE(tokenizer.tokenize("").empty());
}

TEST(WhitespaceTokenizerTest, NoBreakSpaceSeparatesTokens) {
    WhitespaceTokenizer tokenizer;
    EXPECT_EQ(tokenizer.tokenize("a\xC2\xA0" "b"), (Tokens{"a", "b"}));
}

TEST_F(RuleTokenizerTest, DetachesSentencePunctuation) {
    EXPECT_EQ(tok("Olá, mundo!"), (Tokens{"Olá", ",", "mundo", "!"}));
    EXPECT_EQ(tok("(teste)"), (Tokens{"(", "teste", ")"}));
    EXPECT_EQ(tok("\xE2\x80\x9C" "Olá" "\xE2\x80\x9D"), (Tokens{"\xE2\x80\x9C", "Olá", "\xE2\x80\x9D"}));
}

TEST_F(RuleTokenizerTest, KeepsWordInternalPunctuation) {
    EXPECT_EQ(tok("d'água e-mail"), (Tokens{"d'água", "e-mail"}));
    EXPECT_EQ(tok("3,14 1.000."), (Tokens{"3,14", "1.000", "."}));
}

TEST_F(RuleTokenizerTest, GroupsRepeatedPunctuation) {
    EXPECT_EQ(tok("Espera..."), (Tokens{"Espera", "..."}));
    EXPECT_EQ(tok("Sério?!"), (Tokens{"Sério", "?", "!"}));
    EXPECT_EQ(tok("..."), (Tokens{"..."}));
}

TEST_F(RuleTokenizerTest, KeepsAbbreviationsAndInitials) {
    EXPECT_EQ(tok("O Sr. Silva"), (Tokens{"O", "Sr.", "Silva"}));
    EXPECT_EQ(tok("E.U.A."), (Tokens{"E.U.A."}));
    EXPECT_EQ(tok("(etc.)"), (Tokens{"(", "etc.", ")"}));
    EXPECT_EQ(tok("fim."), (Tokens{"fim", "."}));
}

TEST_F(RuleTokenizerTest, KeepsAddressesWhole) {
    EXPECT_EQ(tok("Visite http://example.com/a. Agora"),
        (Tokens{"Visite", "http://example.com/a", ".", "Agora"}));
    EXPECT_EQ(tok("(joao@example.pt)"), (Tokens{"(", "joao@example.pt", ")"}));
}

TEST_F(RuleTokenizerTest, DetachesCurrencySymbols) {
    EXPECT_EQ(tok("$100"), (Tokens{"$", "100"}));
}

TEST_F(RuleTokenizerTest, PassesInvalidUtf8Through) {
    EXPECT_EQ(tok("a\xFF" "b c"), (Tokens{"a\xFF" "b", "c"}));
}
