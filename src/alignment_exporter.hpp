#pragma once

#include "corpus.hpp"
#include "errors.hpp"
#include "tmx_writer.hpp"
#include "translation_unit.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tmx_cwb {

constexpr const char* kToolName = "tmx_cwb";
constexpr const char* kToolVersion = "0.3.0";

// Walks the blocks of an alignment attribute in index order and turns each
// into a translation unit of space-joined surface strings. When a lookup
// fails, next() returns false and error() reports why.
class AlignmentTuStream final : public TuStream {
public:
    AlignmentTuStream(
        const Corpus& source,
        const Corpus& target,
        const AlignmentAttribute& alignment,
        LanguagePair pair
    );

    bool next(TranslationUnit& tu) override;

    const Error& error() const { return error_; }

private:
    bool join_range(const Corpus& corpus, CorpusPosition first, CorpusPosition last, std::string& out);

    const Corpus& source_;
    const Corpus& target_;
    const AlignmentAttribute& alignment_;
    LanguagePair pair_;
    std::size_t index_ = 0;
    std::vector<std::string> words_;
    Error error_;
};

bool export_alignment(
    const Corpus& source,
    const Corpus& target,
    const LanguagePair& pair,
    TmxWriter& writer,
    std::size_t& out_count,
    Error& error
);

// Opens both corpora by name first; CorpusNotFound if either is missing.
bool export_alignment(
    CorpusOpener& opener,
    const std::string& source_name,
    const std::string& target_name,
    const LanguagePair& pair,
    TmxWriter& writer,
    std::size_t& out_count,
    Error& error
);

}  // namespace tmx_cwb
