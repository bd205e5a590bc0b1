#pragma once

#include "corpus.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace tmx_cwb {

// A staging file indexed by identity: tokens become positions 0..n-1 in
// file order and every <tu id='N'> block becomes a region.
class VerticalCorpus final : public Corpus {
public:
    struct Region {
        CorpusPosition start = 0;
        CorpusPosition end = -1;
    };

    explicit VerticalCorpus(std::string name);

    bool load(const std::filesystem::path& staging_file, Error& error);
    bool load(std::istream& in, Error& error);

    const std::string& name() const override { return name_; }
    CorpusPosition size() const { return static_cast<CorpusPosition>(tokens_.size()); }
    const Region* region(const std::string& id) const;

    bool words(CorpusPosition first, CorpusPosition last, std::vector<std::string>& out, Error& error) const override;
    bool alignment(const std::string& attribute, std::unique_ptr<AlignmentAttribute>& out, Error& error) const override;

    void attach_alignment(const std::string& attribute, std::vector<AlignmentBlock> blocks);

private:
    std::string name_;
    std::vector<std::string> tokens_;
    std::unordered_map<std::string, Region> regions_;
    std::unordered_map<std::string, std::vector<AlignmentBlock>> alignments_;
};

// Joins the records of an alignment map against the regions of both
// corpora and attaches the resulting blocks to `source` under the
// lower-cased name of `target`, in map order.
bool load_alignment_map(std::istream& in, VerticalCorpus& source, const VerticalCorpus& target, Error& error);
bool load_alignment_map(
    const std::filesystem::path& path,
    VerticalCorpus& source,
    const VerticalCorpus& target,
    Error& error
);

}  // namespace tmx_cwb
