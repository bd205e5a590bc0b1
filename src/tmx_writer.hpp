#pragma once

#include "errors.hpp"
#include "translation_unit.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <string>

#include <pugixml.hpp>

namespace tmx_cwb {

// Writes a TMX 1.4 document one translation unit at a time; only the
// unit being added is held in memory.
class TmxWriter {
public:
    // "-" writes to standard output.
    explicit TmxWriter(std::filesystem::path out_path);
    explicit TmxWriter(std::ostream& out);

    void begin(const std::string& tool_name, const std::string& tool_version, const std::string& source_lang);
    void add_tu(const TranslationUnit& tu);
    bool end(Error& error);

    std::size_t tu_count() const { return tu_count_; }

private:
    std::filesystem::path out_path_;
    std::ofstream file_;
    std::ostream* out_ = nullptr;
    bool to_file_ = false;
    pugi::xml_document scratch_;
    std::size_t tu_count_ = 0;
};

}  // namespace tmx_cwb
