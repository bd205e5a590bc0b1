#pragma once

#include "errors.hpp"
#include "translation_unit.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>

namespace tmx_cwb {

struct TuExportOptions {
    std::string corpus_base;
    bool tokenize_source = false;
    bool tokenize_target = false;
    std::size_t report_interval = 1000;
};

struct TuExportStats {
    std::size_t units_read = 0;
    std::size_t units_retained = 0;
    std::size_t units_skipped = 0;
    std::chrono::milliseconds wall_time{0};
};

struct StagingPaths {
    std::filesystem::path source;
    std::filesystem::path target;
    std::filesystem::path alignment;

    static StagingPaths in_directory(const std::filesystem::path& dir);
};

using ExportProgressCallback = std::function<void(std::size_t retained)>;

// Streams `units` into the source/target staging streams and the
// alignment map. Units lacking either language are skipped without
// consuming an identifier. A failure leaves the three outputs
// inconsistent; callers discard them. `progress_callback` sees every
// multiple of report_interval and then the final count, each value once.
bool export_translation_units(
    TuStream& units,
    const LanguagePair& pair,
    const TuExportOptions& options,
    std::ostream& source_out,
    std::ostream& target_out,
    std::ostream& alignment_out,
    TuExportStats& out_stats,
    Error& error,
    const ExportProgressCallback& progress_callback = {}
);

bool write_staging_files(
    TuStream& units,
    const LanguagePair& pair,
    const TuExportOptions& options,
    const StagingPaths& paths,
    TuExportStats& out_stats,
    Error& error,
    const ExportProgressCallback& progress_callback = {}
);

void remove_staging_files(const StagingPaths& paths);

}  // namespace tmx_cwb
