#pragma once

#include "errors.hpp"
#include "translation_unit.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <pugixml.hpp>

namespace tmx_cwb {

class TmxDocument {
public:
    bool load(const std::filesystem::path& path, Error& error);
    bool load_string(const std::string& xml, Error& error);

    const std::filesystem::path& source_path() const { return source_path_; }

    // Distinct <tuv> language codes in order of first appearance.
    const std::vector<std::string>& languages() const { return languages_; }

    // A fresh pass over the <tu> elements of <body>, in document order.
    std::unique_ptr<TuStream> stream() const;

private:
    bool index_document(const std::string& origin, Error& error);

    std::filesystem::path source_path_;
    pugi::xml_document xml_;
    pugi::xml_node body_;
    std::vector<std::string> languages_;
};

}  // namespace tmx_cwb
