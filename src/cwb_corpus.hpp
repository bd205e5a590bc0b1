#pragma once

#include "corpus.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tmx_cwb {

struct CwbRegistryEntry {
    std::string id;
    std::filesystem::path home;
    std::vector<std::string> aligned;
};

bool read_registry_entry(const std::filesystem::path& path, CwbRegistryEntry& out, Error& error);

// Reads a CWB extended alignment file: four big-endian 32-bit positions
// per block.
bool read_alx_file(const std::filesystem::path& path, std::vector<AlignmentBlock>& out, Error& error);

class CwbCorpus final : public Corpus {
public:
    CwbCorpus(std::filesystem::path registry_dir, std::string name, CwbRegistryEntry entry);

    const std::string& name() const override { return name_; }

    bool words(CorpusPosition first, CorpusPosition last, std::vector<std::string>& out, Error& error) const override;
    bool alignment(const std::string& attribute, std::unique_ptr<AlignmentAttribute>& out, Error& error) const override;

private:
    bool decode_words(Error& error) const;

    std::filesystem::path registry_dir_;
    std::string name_;
    CwbRegistryEntry entry_;

    // The word attribute is decoded once, on first lookup.
    mutable bool decoded_ = false;
    mutable std::vector<std::string> tokens_;
};

class CwbCorpusOpener final : public CorpusOpener {
public:
    explicit CwbCorpusOpener(std::filesystem::path registry_dir);

    bool open(const std::string& name, std::unique_ptr<Corpus>& out, Error& error) override;

private:
    std::filesystem::path registry_dir_;
};

}  // namespace tmx_cwb
