#include "alignment_exporter.hpp"
#include "config.hpp"
#include "corpus_builder.hpp"
#include "cwb_corpus.hpp"
#include "errors.hpp"
#include "language_detector.hpp"
#include "staging_format.hpp"
#include "tmx_reader.hpp"
#include "tmx_writer.hpp"
#include "tu_exporter.hpp"
#include "vertical_corpus.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace tmx_cwb;

namespace {

std::optional<std::string> hint(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

void print_import_progress(std::size_t retained, bool done) {
    std::cerr << "\r[progress] Processing... " << retained << " translation units";
    if (done) {
        std::cerr << "\n";
    }
    std::cerr.flush();
}

bool run_import(const AppConfig& config, bool stage_only, Error& error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config.tmx_path, ec)) {
        return fail(error, ErrorCode::TmxReadFailure, "Can't open [" + config.tmx_path.string() + "] file for reading");
    }

    std::filesystem::path registry;
    if (!stage_only) {
        if (!std::filesystem::is_directory(config.corpora_dir, ec)) {
            return fail(error, ErrorCode::InvalidArgument, "Need a corpora folder: " + config.corpora_dir.string());
        }
        if (!resolve_registry_dir(config.registry, registry, error)) {
            return false;
        }
    }

    TmxDocument doc;
    if (!doc.load(config.tmx_path, error)) {
        return false;
    }

    LanguagePair pair;
    if (!resolve_language_pair(doc.languages(), hint(config.from_lang), hint(config.to_lang), pair, error)) {
        return false;
    }

    TuExportOptions options;
    options.corpus_base = sanitize_corpus_base(
        config.corpus_name.empty() ? config.tmx_path.filename().string() : config.corpus_name
    );
    options.tokenize_source = config.tokenize_source;
    options.tokenize_target = config.tokenize_target;

    std::filesystem::create_directories(config.staging_dir, ec);
    if (ec) {
        return fail(error, ErrorCode::StagingIOFailure,
            "Failed to create staging folder " + config.staging_dir.string() + ": " + ec.message());
    }
    const StagingPaths paths = StagingPaths::in_directory(config.staging_dir);

    ExportProgressCallback progress;
    if (config.verbose) {
        progress = [](std::size_t retained) { print_import_progress(retained, false); };
    }

    auto units = doc.stream();
    TuExportStats stats;
    if (!write_staging_files(*units, pair, options, paths, stats, error, progress)) {
        return false;
    }
    if (config.verbose) {
        print_import_progress(stats.units_retained, true);
    }

    std::cout
        << "[ok] " << doc.source_path().filename().string()
        << " pair=" << pair.source << "/" << pair.target
        << " retained=" << stats.units_retained
        << " skipped=" << stats.units_skipped
        << " time_ms=" << stats.wall_time.count()
        << "\n";

    if (stage_only) {
        std::cout << "[summary] staging files: " << paths.source.string() << " " << paths.target.string() << " "
                  << paths.alignment.string() << "\n";
        return true;
    }

    CwbSettings settings;
    settings.corpora_dir = config.corpora_dir;
    settings.registry_dir = registry;
    settings.verbose = config.verbose;
    CwbCorpusBuilder builder(settings);

    const ParallelCorpusNames names{
        corpus_name(options.corpus_base, pair.source),
        corpus_name(options.corpus_base, pair.target)
    };
    if (!build_parallel_corpus(builder, names, paths, error)) {
        std::cerr << "[error] staging files kept in " << config.staging_dir.string() << "\n";
        return false;
    }

    if (!config.keep_staging) {
        remove_staging_files(paths);
    }

    std::cout << "[summary] corpora=" << names.source << "," << names.target << " registry=" << registry.string()
              << "\n";
    return true;
}

bool run_export(const AppConfig& config, Error& error) {
    std::filesystem::path registry;
    if (!resolve_registry_dir(config.registry, registry, error)) {
        return false;
    }

    std::string source_name = config.source_corpus;
    std::string target_name = config.target_corpus;
    if (!config.corpus_name.empty()) {
        const std::string base = sanitize_corpus_base(config.corpus_name);
        source_name = corpus_name(base, config.source_lang);
        target_name = corpus_name(base, config.target_lang);
    }

    CwbCorpusOpener opener(registry);
    TmxWriter writer(config.output_path);
    std::size_t count = 0;
    if (!export_alignment(
            opener,
            source_name,
            target_name,
            LanguagePair{config.source_lang, config.target_lang},
            writer,
            count,
            error
        )) {
        return false;
    }

    std::cerr << "[ok] " << source_name << " -> " << target_name << " translation_units=" << count << "\n";
    return true;
}

bool run_staging_export(const AppConfig& config, Error& error) {
    VerticalCorpus source("source");
    VerticalCorpus target("target");
    if (!source.load(config.source_staging, error) || !target.load(config.target_staging, error)) {
        return false;
    }
    if (!load_alignment_map(config.alignment_path, source, target, error)) {
        return false;
    }

    TmxWriter writer(config.output_path);
    std::size_t count = 0;
    if (!export_alignment(source, target, LanguagePair{config.source_lang, config.target_lang}, writer, count, error)) {
        return false;
    }

    std::cerr << "[ok] " << config.source_staging.filename().string() << " -> "
              << config.target_staging.filename().string() << " translation_units=" << count << "\n";
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string parse_error;

    if (!parse_args(argc, argv, config, parse_error)) {
        if (parse_error != "help") {
            std::cerr << "Argument error: " << parse_error << "\n\n";
        }
        print_usage(argv[0]);
        return parse_error == "help" ? 0 : 1;
    }

    Error error;
    bool ok = false;
    try {
        switch (config.command) {
        case Command::ToCwb:
            ok = run_import(config, false, error);
            break;
        case Command::Stage:
            ok = run_import(config, true, error);
            break;
        case Command::ToTmx:
            ok = run_export(config, error);
            break;
        case Command::StagingToTmx:
            ok = run_staging_export(config, error);
            break;
        }
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }

    if (!ok) {
        std::cerr << "[fatal] " << error_code_name(error.code) << ": " << error.message << "\n";
        return 1;
    }
    return 0;
}
