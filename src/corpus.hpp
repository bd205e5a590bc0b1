#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tmx_cwb {

using CorpusPosition = std::int64_t;

// Inclusive token ranges in the source and target corpus. A side whose
// end precedes its start (or is negative) covers no tokens.
struct AlignmentBlock {
    CorpusPosition source_start = 0;
    CorpusPosition source_end = -1;
    CorpusPosition target_start = 0;
    CorpusPosition target_end = -1;
};

class AlignmentAttribute {
public:
    virtual ~AlignmentAttribute() = default;

    virtual std::size_t block_count() const = 0;
    virtual bool block(std::size_t index, AlignmentBlock& out, Error& error) const = 0;
};

class Corpus {
public:
    virtual ~Corpus() = default;

    virtual const std::string& name() const = 0;

    // Word attribute strings for positions [first, last] in order.
    virtual bool words(CorpusPosition first, CorpusPosition last, std::vector<std::string>& out, Error& error) const = 0;

    // Alignment attribute towards another corpus, looked up by name.
    virtual bool alignment(
        const std::string& attribute,
        std::unique_ptr<AlignmentAttribute>& out,
        Error& error
    ) const = 0;
};

class CorpusOpener {
public:
    virtual ~CorpusOpener() = default;

    virtual bool open(const std::string& name, std::unique_ptr<Corpus>& out, Error& error) = 0;
};

// Blocks held in memory, used by adapters that load the whole attribute.
class BlockListAlignment final : public AlignmentAttribute {
public:
    explicit BlockListAlignment(std::vector<AlignmentBlock> blocks) : blocks_(std::move(blocks)) {}

    std::size_t block_count() const override { return blocks_.size(); }

    bool block(std::size_t index, AlignmentBlock& out, Error& error) const override {
        if (index >= blocks_.size()) {
            return fail(error, ErrorCode::NoAlignmentData,
                "Alignment block " + std::to_string(index) + " out of range");
        }
        out = blocks_[index];
        return true;
    }

private:
    std::vector<AlignmentBlock> blocks_;
};

}  // namespace tmx_cwb
