#include "corpus_builder.hpp"

#include "staging_format.hpp"
#include "subprocess.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace tmx_cwb {
namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
    std::size_t first = 0;
    while (first < s.size() && (s[first] == ' ' || s[first] == '\t')) {
        ++first;
    }
    return s.substr(first);
}

}  // namespace

CwbCorpusBuilder::CwbCorpusBuilder(CwbSettings settings) : settings_(std::move(settings)) {}

bool CwbCorpusBuilder::run(const std::vector<std::string>& args, Error& error) const {
    std::cerr << "[run] " << describe_command(args) << "\n";

    LineCallback relay;
    if (settings_.verbose) {
        relay = [](const std::string& line) { std::cerr << "[cwb] " << line << "\n"; };
    }

    ToolResult result;
    std::string launch_error;
    if (!run_tool(args, relay, result, launch_error)) {
        return fail(error, ErrorCode::ExternalToolFailure, args.front() + ": " + launch_error);
    }
    if (!result.success()) {
        return fail(error, ErrorCode::ExternalToolFailure, args.front() + " failed with " + result.describe());
    }
    return true;
}

bool CwbCorpusBuilder::encode(const std::string& corpus_name, const std::filesystem::path& staging_file, Error& error) {
    const auto folder = settings_.corpora_dir / corpus_name;
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        return fail(error, ErrorCode::StagingIOFailure,
            "Failed to create corpus folder " + folder.string() + ": " + ec.message());
    }

    const std::string structure = std::string(kStagingRegion) + "+" + kStagingRegionAttribute;
    return run({
        "cwb-encode",
        "-c", "utf8",
        "-d", folder.string(),
        "-f", staging_file.string(),
        "-R", (settings_.registry_dir / corpus_name).string(),
        "-S", structure
    }, error);
}

bool CwbCorpusBuilder::make(const std::string& corpus_name, Error& error) {
    return run({"cwb-make", "-r", settings_.registry_dir.string(), "-V", to_upper_utf8(corpus_name)}, error);
}

bool CwbCorpusBuilder::import_alignment(const std::filesystem::path& alignment_file, bool inverse, Error& error) {
    std::vector<std::string> args = {"cwb-align-import", "-r", settings_.registry_dir.string()};
    if (settings_.verbose) {
        args.push_back("-v");
    }
    if (inverse) {
        args.push_back("-inverse");
    }
    args.push_back(alignment_file.string());
    return run(args, error);
}

bool build_parallel_corpus(
    CorpusBuilder& builder,
    const ParallelCorpusNames& names,
    const StagingPaths& paths,
    Error& error
) {
    if (!builder.encode(names.source, paths.source, error)) {
        return false;
    }
    if (!builder.make(names.source, error)) {
        return false;
    }
    if (!builder.encode(names.target, paths.target, error)) {
        return false;
    }
    if (!builder.make(names.target, error)) {
        return false;
    }
    if (!builder.import_alignment(paths.alignment, false, error)) {
        return false;
    }
    return builder.import_alignment(paths.alignment, true, error);
}

bool resolve_registry_dir(const std::string& explicit_registry, std::filesystem::path& out, Error& error) {
    std::string registry = explicit_registry;

    if (registry.empty()) {
        if (const char* env = std::getenv("CORPUS_REGISTRY")) {
            registry = env;
        }
    }

    if (registry.empty()) {
        std::string reported;
        ToolResult result;
        std::string launch_error;
        const bool launched = run_tool(
            {"cwb-config", "-r"},
            [&](const std::string& line) {
                if (reported.empty()) {
                    reported = trim(line);
                }
            },
            result,
            launch_error
        );
        if (launched && result.success()) {
            registry = reported;
        }
    }

    std::error_code ec;
    if (registry.empty() || !std::filesystem::is_directory(registry, ec)) {
        return fail(error, ErrorCode::InvalidArgument, "Could not detect a suitable CWB registry folder");
    }

    out = registry;
    return true;
}

}  // namespace tmx_cwb
