#include "alignment_exporter.hpp"

#include "staging_format.hpp"

#include <memory>
#include <utility>

namespace tmx_cwb {

AlignmentTuStream::AlignmentTuStream(
    const Corpus& source,
    const Corpus& target,
    const AlignmentAttribute& alignment,
    LanguagePair pair
)
    : source_(source), target_(target), alignment_(alignment), pair_(std::move(pair)) {}

bool AlignmentTuStream::join_range(const Corpus& corpus, CorpusPosition first, CorpusPosition last, std::string& out) {
    out.clear();
    if (!corpus.words(first, last, words_, error_)) {
        return false;
    }
    for (std::size_t i = 0; i < words_.size(); ++i) {
        if (i > 0) {
            out.push_back(' ');
        }
        out += words_[i];
    }
    return true;
}

bool AlignmentTuStream::next(TranslationUnit& tu) {
    if (error_ || index_ >= alignment_.block_count()) {
        return false;
    }

    AlignmentBlock block;
    if (!alignment_.block(index_, block, error_)) {
        return false;
    }

    std::string source_text;
    std::string target_text;
    if (!join_range(source_, block.source_start, block.source_end, source_text)
        || !join_range(target_, block.target_start, block.target_end, target_text)) {
        return false;
    }

    tu.segments.clear();
    tu.set(pair_.source, std::move(source_text));
    tu.set(pair_.target, std::move(target_text));
    ++index_;
    return true;
}

bool export_alignment(
    const Corpus& source,
    const Corpus& target,
    const LanguagePair& pair,
    TmxWriter& writer,
    std::size_t& out_count,
    Error& error
) {
    out_count = 0;

    const std::string attribute = to_lower_utf8(target.name());
    std::unique_ptr<AlignmentAttribute> alignment;
    if (!source.alignment(attribute, alignment, error)) {
        return false;
    }
    if (alignment->block_count() == 0) {
        return fail(error, ErrorCode::NoAlignmentData,
            "Alignment " + source.name() + " -> " + attribute + " has no blocks");
    }

    writer.begin(kToolName, kToolVersion, pair.source);

    AlignmentTuStream units(source, target, *alignment, pair);
    TranslationUnit tu;
    while (units.next(tu)) {
        writer.add_tu(tu);
        ++out_count;
    }
    if (units.error()) {
        error = units.error();
        return false;
    }

    return writer.end(error);
}

bool export_alignment(
    CorpusOpener& opener,
    const std::string& source_name,
    const std::string& target_name,
    const LanguagePair& pair,
    TmxWriter& writer,
    std::size_t& out_count,
    Error& error
) {
    std::unique_ptr<Corpus> source;
    if (!opener.open(source_name, source, error)) {
        return false;
    }
    std::unique_ptr<Corpus> target;
    if (!opener.open(target_name, target, error)) {
        return false;
    }
    return export_alignment(*source, *target, pair, writer, out_count, error);
}

}  // namespace tmx_cwb
