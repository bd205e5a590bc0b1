#include "tu_exporter.hpp"

#include "staging_format.hpp"
#include "tokenizer.hpp"

#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace tmx_cwb {
namespace {

bool streams_good(const std::ostream& a, const std::ostream& b, const std::ostream& c) {
    return a.good() && b.good() && c.good();
}

// Escaping runs per token so the rule tokenizer never splits an entity.
std::vector<std::string> escaped_tokens(const Tokenizer& tokenizer, const std::string& text) {
    auto tokens = tokenizer.tokenize(text);
    for (auto& token : tokens) {
        token = escape_markup(token);
    }
    return tokens;
}

}  // namespace

StagingPaths StagingPaths::in_directory(const std::filesystem::path& dir) {
    return StagingPaths{dir / "source.cqp", dir / "target.cqp", dir / "align.txt"};
}

bool export_translation_units(
    TuStream& units,
    const LanguagePair& pair,
    const TuExportOptions& options,
    std::ostream& source_out,
    std::ostream& target_out,
    std::ostream& alignment_out,
    TuExportStats& out_stats,
    Error& error,
    const ExportProgressCallback& progress_callback
) {
    out_stats = TuExportStats{};
    const auto started = std::chrono::steady_clock::now();

    const auto source_tokenizer = Tokenizer::create(options.tokenize_source ? "rule" : "whitespace");
    const auto target_tokenizer = Tokenizer::create(options.tokenize_target ? "rule" : "whitespace");

    alignment_out << format_alignment_header(
        corpus_id(options.corpus_base, pair.source),
        corpus_id(options.corpus_base, pair.target)
    );

    std::size_t next_id = 1;
    TranslationUnit tu;
    while (units.next(tu)) {
        ++out_stats.units_read;

        const std::string* source_text = tu.find(pair.source);
        const std::string* target_text = tu.find(pair.target);
        if (source_text == nullptr || target_text == nullptr) {
            ++out_stats.units_skipped;
            continue;
        }

        const auto source_tokens = escaped_tokens(*source_tokenizer, *source_text);
        const auto target_tokens = escaped_tokens(*target_tokenizer, *target_text);

        const std::size_t id = next_id++;
        alignment_out << format_alignment_record(id);
        source_out << format_staging_block(id, source_tokens);
        target_out << format_staging_block(id, target_tokens);

        if (!streams_good(source_out, target_out, alignment_out)) {
            return fail(error, ErrorCode::StagingIOFailure,
                "Failed to write staging output at translation unit " + std::to_string(id));
        }

        ++out_stats.units_retained;
        if (progress_callback && options.report_interval > 0 && id % options.report_interval == 0) {
            progress_callback(id);
        }
    }

    source_out.flush();
    target_out.flush();
    alignment_out.flush();
    if (!streams_good(source_out, target_out, alignment_out)) {
        return fail(error, ErrorCode::StagingIOFailure, "Failed to flush staging output");
    }

    const std::size_t retained = out_stats.units_retained;
    const bool reported_last = options.report_interval > 0 && retained > 0 && retained % options.report_interval == 0;
    if (progress_callback && !reported_last) {
        progress_callback(retained);
    }

    out_stats.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );
    return true;
}

bool write_staging_files(
    TuStream& units,
    const LanguagePair& pair,
    const TuExportOptions& options,
    const StagingPaths& paths,
    TuExportStats& out_stats,
    Error& error,
    const ExportProgressCallback& progress_callback
) {
    std::ofstream source_out(paths.source, std::ios::binary);
    if (!source_out) {
        return fail(error, ErrorCode::StagingIOFailure, "Can't create staging file " + paths.source.string());
    }
    std::ofstream target_out(paths.target, std::ios::binary);
    if (!target_out) {
        return fail(error, ErrorCode::StagingIOFailure, "Can't create staging file " + paths.target.string());
    }
    std::ofstream alignment_out(paths.alignment, std::ios::binary);
    if (!alignment_out) {
        return fail(error, ErrorCode::StagingIOFailure, "Can't create alignment file " + paths.alignment.string());
    }

    return export_translation_units(
        units, pair, options, source_out, target_out, alignment_out, out_stats, error, progress_callback
    );
}

void remove_staging_files(const StagingPaths& paths) {
    std::error_code ec;
    std::filesystem::remove(paths.source, ec);
    std::filesystem::remove(paths.target, ec);
    std::filesystem::remove(paths.alignment, ec);
}

}  // namespace tmx_cwb
