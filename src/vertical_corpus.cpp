#include "vertical_corpus.hpp"

#include "staging_format.hpp"

#include <fstream>
#include <istream>
#include <utility>

namespace tmx_cwb {
namespace {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::size_t pos = 0;
    while (true) {
        const auto tab = line.find('\t', pos);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(pos));
            return fields;
        }
        fields.push_back(line.substr(pos, tab - pos));
        pos = tab + 1;
    }
}

bool parse_open_tag(const std::string& line, std::string& id) {
    const std::string open = std::string("<") + kStagingRegion;
    if (line.compare(0, open.size(), open) != 0 || line.size() <= open.size()
        || (line[open.size()] != ' ' && line[open.size()] != '>') || line.back() != '>') {
        return false;
    }

    id.clear();
    const std::string key = std::string(kStagingRegionAttribute) + "=";
    const auto at = line.find(key, open.size());
    if (at == std::string::npos || at + key.size() >= line.size()) {
        return true;
    }
    const char quote = line[at + key.size()];
    if (quote != '\'' && quote != '"') {
        return true;
    }
    const auto close = line.find(quote, at + key.size() + 1);
    if (close != std::string::npos) {
        id = line.substr(at + key.size() + 1, close - at - key.size() - 1);
    }
    return true;
}

}  // namespace

VerticalCorpus::VerticalCorpus(std::string name) : name_(std::move(name)) {}

bool VerticalCorpus::load(const std::filesystem::path& staging_file, Error& error) {
    std::ifstream in(staging_file, std::ios::binary);
    if (!in) {
        return fail(error, ErrorCode::CorpusNotFound, "Can't open staging file " + staging_file.string());
    }
    return load(in, error);
}

bool VerticalCorpus::load(std::istream& in, Error& error) {
    tokens_.clear();
    regions_.clear();

    const std::string close_tag = std::string("</") + kStagingRegion + ">";

    std::string line;
    std::string id;
    std::string current_id;
    Region current;
    bool in_region = false;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (parse_open_tag(line, id)) {
            if (in_region) {
                return fail(error, ErrorCode::StagingIOFailure,
                    name_ + ": nested region at line " + std::to_string(line_no));
            }
            in_region = true;
            current_id = id;
            current = Region{size(), -1};
        } else if (line == close_tag) {
            if (!in_region) {
                return fail(error, ErrorCode::StagingIOFailure,
                    name_ + ": unmatched region end at line " + std::to_string(line_no));
            }
            current.end = size() - 1;
            regions_[current_id] = current;
            in_region = false;
        } else {
            tokens_.push_back(line);
        }
    }

    if (in.bad()) {
        return fail(error, ErrorCode::StagingIOFailure, name_ + ": read error");
    }
    if (in_region) {
        return fail(error, ErrorCode::StagingIOFailure, name_ + ": unterminated region " + current_id);
    }
    return true;
}

const VerticalCorpus::Region* VerticalCorpus::region(const std::string& id) const {
    const auto it = regions_.find(id);
    return it == regions_.end() ? nullptr : &it->second;
}

bool VerticalCorpus::words(CorpusPosition first, CorpusPosition last, std::vector<std::string>& out, Error& error) const {
    out.clear();
    if (first < 0 || last < first) {
        return true;
    }
    if (last >= size()) {
        return fail(error, ErrorCode::NoAlignmentData,
            name_ + ": position " + std::to_string(last) + " beyond corpus size " + std::to_string(size()));
    }
    out.assign(tokens_.begin() + first, tokens_.begin() + last + 1);
    return true;
}

bool VerticalCorpus::alignment(
    const std::string& attribute,
    std::unique_ptr<AlignmentAttribute>& out,
    Error& error
) const {
    const auto it = alignments_.find(attribute);
    if (it == alignments_.end()) {
        return fail(error, ErrorCode::NoAlignmentData, name_ + ": no alignment attribute " + attribute);
    }
    out = std::make_unique<BlockListAlignment>(it->second);
    return true;
}

void VerticalCorpus::attach_alignment(const std::string& attribute, std::vector<AlignmentBlock> blocks) {
    alignments_[attribute] = std::move(blocks);
}

bool load_alignment_map(std::istream& in, VerticalCorpus& source, const VerticalCorpus& target, Error& error) {
    std::string line;
    if (!std::getline(in, line)) {
        return fail(error, ErrorCode::NoAlignmentData, "Alignment map is empty");
    }

    const auto header = split_tabs(line);
    const auto brace = header.size() == 4 ? header[3].find('{') : std::string::npos;
    if (brace == std::string::npos) {
        return fail(error, ErrorCode::NoAlignmentData, "Malformed alignment map header: " + line);
    }
    const std::string key_prefix = header[3].substr(0, brace);

    auto strip_key = [&](const std::string& key, std::string& id) {
        if (key.compare(0, key_prefix.size(), key_prefix) != 0) {
            return false;
        }
        id = key.substr(key_prefix.size());
        return true;
    };

    std::vector<AlignmentBlock> blocks;
    std::size_t line_no = 1;
    std::string source_key;
    std::string target_key;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        const auto fields = split_tabs(line);
        if (fields.size() != 2 || !strip_key(fields[0], source_key) || !strip_key(fields[1], target_key)) {
            return fail(error, ErrorCode::NoAlignmentData,
                "Malformed alignment record at line " + std::to_string(line_no));
        }

        const auto* source_region = source.region(source_key);
        const auto* target_region = target.region(target_key);
        if (source_region == nullptr || target_region == nullptr) {
            return fail(error, ErrorCode::NoAlignmentData,
                "Alignment record at line " + std::to_string(line_no) + " names an unknown region");
        }

        blocks.push_back(AlignmentBlock{
            source_region->start,
            source_region->end,
            target_region->start,
            target_region->end
        });
    }

    source.attach_alignment(to_lower_utf8(target.name()), std::move(blocks));
    return true;
}

bool load_alignment_map(
    const std::filesystem::path& path,
    VerticalCorpus& source,
    const VerticalCorpus& target,
    Error& error
) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(error, ErrorCode::NoAlignmentData, "Can't open alignment map " + path.string());
    }
    return load_alignment_map(in, source, target, error);
}

}  // namespace tmx_cwb
