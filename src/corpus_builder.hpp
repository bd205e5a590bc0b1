#pragma once

#include "errors.hpp"
#include "tu_exporter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tmx_cwb {

// One method per indexing step. Each step reports ExternalToolFailure
// through `error` when the underlying tool does not complete cleanly.
class CorpusBuilder {
public:
    virtual ~CorpusBuilder() = default;

    virtual bool encode(const std::string& corpus_name, const std::filesystem::path& staging_file, Error& error) = 0;
    virtual bool make(const std::string& corpus_name, Error& error) = 0;
    virtual bool import_alignment(const std::filesystem::path& alignment_file, bool inverse, Error& error) = 0;
};

struct CwbSettings {
    std::filesystem::path corpora_dir;
    std::filesystem::path registry_dir;
    bool verbose = false;
};

class CwbCorpusBuilder final : public CorpusBuilder {
public:
    explicit CwbCorpusBuilder(CwbSettings settings);

    bool encode(const std::string& corpus_name, const std::filesystem::path& staging_file, Error& error) override;
    bool make(const std::string& corpus_name, Error& error) override;
    bool import_alignment(const std::filesystem::path& alignment_file, bool inverse, Error& error) override;

private:
    bool run(const std::vector<std::string>& args, Error& error) const;

    CwbSettings settings_;
};

struct ParallelCorpusNames {
    std::string source;
    std::string target;
};

// Source encode + make, target encode + make, then the alignment import
// in both directions. Stops at the first failing step.
bool build_parallel_corpus(
    CorpusBuilder& builder,
    const ParallelCorpusNames& names,
    const StagingPaths& paths,
    Error& error
);

// --registry, then $CORPUS_REGISTRY, then `cwb-config -r`.
bool resolve_registry_dir(const std::string& explicit_registry, std::filesystem::path& out, Error& error);

}  // namespace tmx_cwb
