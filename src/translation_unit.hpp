#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace tmx_cwb {

struct LanguagePair {
    std::string source;
    std::string target;
};

inline bool operator==(const LanguagePair& a, const LanguagePair& b) {
    return a.source == b.source && a.target == b.target;
}

// One aligned row: language code -> segment text, in document order.
struct TranslationUnit {
    std::vector<std::pair<std::string, std::string>> segments;

    const std::string* find(const std::string& lang) const {
        for (const auto& [code, text] : segments) {
            if (code == lang) {
                return &text;
            }
        }
        return nullptr;
    }

    void set(const std::string& lang, std::string text) {
        for (auto& [code, value] : segments) {
            if (code == lang) {
                value = std::move(text);
                return;
            }
        }
        segments.emplace_back(lang, std::move(text));
    }
};

// Finite, forward-only source of translation units. Callers may stop
// pulling at any point.
class TuStream {
public:
    virtual ~TuStream() = default;

    // Returns false once the stream is exhausted.
    virtual bool next(TranslationUnit& tu) = 0;
};

class VectorTuStream final : public TuStream {
public:
    explicit VectorTuStream(std::vector<TranslationUnit> units) : units_(std::move(units)) {}

    bool next(TranslationUnit& tu) override {
        if (index_ >= units_.size()) {
            return false;
        }
        tu = units_[index_++];
        return true;
    }

private:
    std::vector<TranslationUnit> units_;
    std::size_t index_ = 0;
};

}  // namespace tmx_cwb
