#include "tmx_writer.hpp"

#include <iostream>
#include <utility>

namespace tmx_cwb {
namespace {

constexpr const char* kIndent = "  ";

}  // namespace

TmxWriter::TmxWriter(std::filesystem::path out_path) : out_path_(std::move(out_path)) {
    if (out_path_ == "-") {
        out_ = &std::cout;
    } else {
        to_file_ = true;
    }
}

TmxWriter::TmxWriter(std::ostream& out) : out_(&out) {}

void TmxWriter::begin(const std::string& tool_name, const std::string& tool_version, const std::string& source_lang) {
    tu_count_ = 0;
    if (to_file_) {
        file_.open(out_path_, std::ios::binary | std::ios::trunc);
        out_ = &file_;
    }

    *out_ << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
          << "<tmx version=\"1.4\">\n";

    scratch_.reset();
    auto header = scratch_.append_child("header");
    header.append_attribute("creationtool") = tool_name.c_str();
    header.append_attribute("creationtoolversion") = tool_version.c_str();
    header.append_attribute("segtype") = "sentence";
    header.append_attribute("o-tmf") = "plain text";
    header.append_attribute("adminlang") = "en";
    header.append_attribute("srclang") = source_lang.c_str();
    header.append_attribute("datatype") = "plaintext";
    header.print(*out_, kIndent, pugi::format_default, pugi::encoding_utf8, 1);

    *out_ << kIndent << "<body>\n";
}

void TmxWriter::add_tu(const TranslationUnit& tu) {
    scratch_.reset();
    auto tu_node = scratch_.append_child("tu");
    for (const auto& [lang, text] : tu.segments) {
        auto tuv = tu_node.append_child("tuv");
        tuv.append_attribute("xml:lang") = lang.c_str();
        // Corpus text is already UTF-8; pugixml stores it byte for byte.
        tuv.append_child("seg").text().set(text.c_str());
    }
    tu_node.print(*out_, kIndent, pugi::format_default, pugi::encoding_utf8, 2);
    ++tu_count_;
}

bool TmxWriter::end(Error& error) {
    if (out_ == nullptr) {
        return fail(error, ErrorCode::TmxWriteFailure, "Failed to write TMX: " + out_path_.string());
    }

    *out_ << kIndent << "</body>\n"
          << "</tmx>\n";
    out_->flush();
    if (to_file_) {
        file_.close();
    }

    if (!*out_) {
        if (to_file_) {
            return fail(error, ErrorCode::TmxWriteFailure, "Failed to write TMX: " + out_path_.string());
        }
        return fail(error, ErrorCode::TmxWriteFailure, "Failed to write TMX to output stream");
    }
    return true;
}

}  // namespace tmx_cwb
