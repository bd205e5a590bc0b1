#include "cwb_corpus.hpp"

#include "staging_format.hpp"
#include "subprocess.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <utility>

namespace tmx_cwb {
namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::int32_t read_be32(const unsigned char* p) {
    const std::uint32_t value = (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16)
        | (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
    return static_cast<std::int32_t>(value);
}

}  // namespace

bool read_registry_entry(const std::filesystem::path& path, CwbRegistryEntry& out, Error& error) {
    out = CwbRegistryEntry{};

    std::ifstream in(path);
    if (!in) {
        return fail(error, ErrorCode::CorpusNotFound, "Can't read registry entry " + path.string());
    }

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        const auto space = line.find_first_of(" \t");
        if (space == std::string::npos) {
            continue;
        }
        const std::string key = line.substr(0, space);
        const std::string value = unquote(trim(line.substr(space + 1)));

        if (key == "ID") {
            out.id = value;
        } else if (key == "HOME") {
            out.home = value;
        } else if (key == "ALIGNED") {
            out.aligned.push_back(value);
        }
    }

    if (out.home.empty()) {
        return fail(error, ErrorCode::CorpusNotFound, "Registry entry " + path.string() + " has no HOME");
    }
    return true;
}

bool read_alx_file(const std::filesystem::path& path, std::vector<AlignmentBlock>& out, Error& error) {
    out.clear();

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(error, ErrorCode::NoAlignmentData, "Can't open alignment data " + path.string());
    }

    const std::vector<unsigned char> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (bytes.size() % 16 != 0) {
        return fail(error, ErrorCode::NoAlignmentData, "Truncated alignment data " + path.string());
    }

    out.reserve(bytes.size() / 16);
    for (std::size_t offset = 0; offset < bytes.size(); offset += 16) {
        const unsigned char* p = bytes.data() + offset;
        out.push_back(AlignmentBlock{read_be32(p), read_be32(p + 4), read_be32(p + 8), read_be32(p + 12)});
    }
    return true;
}

CwbCorpus::CwbCorpus(std::filesystem::path registry_dir, std::string name, CwbRegistryEntry entry)
    : registry_dir_(std::move(registry_dir)), name_(std::move(name)), entry_(std::move(entry)) {}

bool CwbCorpus::decode_words(Error& error) const {
    if (decoded_) {
        return true;
    }

    tokens_.clear();
    const std::vector<std::string> args = {
        "cwb-decode", "-C", "-r", registry_dir_.string(), to_upper_utf8(entry_.id.empty() ? name_ : entry_.id),
        "-P", "word"
    };

    ToolResult result;
    std::string launch_error;
    if (!run_tool(args, [&](const std::string& line) { tokens_.push_back(line); }, result, launch_error)) {
        return fail(error, ErrorCode::ExternalToolFailure, "cwb-decode: " + launch_error);
    }
    if (!result.success()) {
        tokens_.clear();
        return fail(error, ErrorCode::ExternalToolFailure, "cwb-decode failed with " + result.describe());
    }

    decoded_ = true;
    return true;
}

bool CwbCorpus::words(CorpusPosition first, CorpusPosition last, std::vector<std::string>& out, Error& error) const {
    out.clear();
    if (first < 0 || last < first) {
        return true;
    }
    if (!decode_words(error)) {
        return false;
    }
    if (last >= static_cast<CorpusPosition>(tokens_.size())) {
        return fail(error, ErrorCode::NoAlignmentData,
            name_ + ": position " + std::to_string(last) + " beyond corpus size " + std::to_string(tokens_.size()));
    }
    out.assign(tokens_.begin() + first, tokens_.begin() + last + 1);
    return true;
}

bool CwbCorpus::alignment(const std::string& attribute, std::unique_ptr<AlignmentAttribute>& out, Error& error) const {
    const std::string wanted = to_lower_utf8(attribute);
    const bool declared = std::any_of(entry_.aligned.begin(), entry_.aligned.end(), [&](const std::string& a) {
        return to_lower_utf8(a) == wanted;
    });
    if (!declared) {
        return fail(error, ErrorCode::NoAlignmentData, name_ + " has no alignment attribute " + wanted);
    }

    std::vector<AlignmentBlock> blocks;
    if (!read_alx_file(entry_.home / (wanted + ".alx"), blocks, error)) {
        return false;
    }
    out = std::make_unique<BlockListAlignment>(std::move(blocks));
    return true;
}

CwbCorpusOpener::CwbCorpusOpener(std::filesystem::path registry_dir) : registry_dir_(std::move(registry_dir)) {}

bool CwbCorpusOpener::open(const std::string& name, std::unique_ptr<Corpus>& out, Error& error) {
    const std::string lower = to_lower_utf8(name);
    const auto path = registry_dir_ / lower;

    std::error_code ec;
    if (name.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return fail(error, ErrorCode::CorpusNotFound, "Can't find corpus [" + name + "]");
    }

    CwbRegistryEntry entry;
    if (!read_registry_entry(path, entry, error)) {
        return false;
    }

    out = std::make_unique<CwbCorpus>(registry_dir_, lower, std::move(entry));
    return true;
}

}  // namespace tmx_cwb
