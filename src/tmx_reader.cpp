#include "tmx_reader.hpp"

#include <algorithm>
#include <unordered_set>

namespace tmx_cwb {
namespace {

std::string local_name(const char* raw_name) {
    if (raw_name == nullptr) {
        return {};
    }
    std::string name(raw_name);
    const auto pos = name.find(':');
    if (pos == std::string::npos) {
        return name;
    }
    return name.substr(pos + 1);
}

// Inline elements that carry native markup codes rather than text.
bool is_native_code_tag(const std::string& name) {
    static const std::unordered_set<std::string> tags = {"bpt", "ept", "ph", "it", "ut"};
    return tags.contains(name);
}

std::string tuv_language(const pugi::xml_node& tuv) {
    if (const auto attr = tuv.attribute("xml:lang")) {
        return attr.value();
    }
    if (const auto attr = tuv.attribute("lang")) {
        return attr.value();
    }
    return {};
}

void collect_text(const pugi::xml_node& node, std::string& out) {
    if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
        out.append(node.value());
        return;
    }

    if (node.type() != pugi::node_element) {
        return;
    }

    if (is_native_code_tag(local_name(node.name()))) {
        return;
    }

    for (const auto& child : node.children()) {
        collect_text(child, out);
    }
}

pugi::xml_node find_child(const pugi::xml_node& parent, const std::string& name) {
    for (const auto& child : parent.children()) {
        if (child.type() == pugi::node_element && local_name(child.name()) == name) {
            return child;
        }
    }
    return {};
}

pugi::xml_node next_tu(pugi::xml_node node) {
    while (node && !(node.type() == pugi::node_element && local_name(node.name()) == "tu")) {
        node = node.next_sibling();
    }
    return node;
}

class TmxTuStream final : public TuStream {
public:
    explicit TmxTuStream(const pugi::xml_node& body) : current_(next_tu(body.first_child())) {}

    bool next(TranslationUnit& tu) override {
        if (!current_) {
            return false;
        }

        tu.segments.clear();
        for (const auto& tuv : current_.children()) {
            if (tuv.type() != pugi::node_element || local_name(tuv.name()) != "tuv") {
                continue;
            }
            const std::string lang = tuv_language(tuv);
            const auto seg = find_child(tuv, "seg");
            if (lang.empty() || !seg) {
                continue;
            }
            std::string text;
            collect_text(seg, text);
            tu.set(lang, std::move(text));
        }

        current_ = next_tu(current_.next_sibling());
        return true;
    }

private:
    pugi::xml_node current_;
};

}  // namespace

bool TmxDocument::load(const std::filesystem::path& path, Error& error) {
    source_path_ = path;

    const pugi::xml_parse_result parse = xml_.load_file(path.c_str(), pugi::parse_default | pugi::parse_ws_pcdata);
    if (!parse) {
        return fail(error, ErrorCode::TmxReadFailure,
            "Failed to parse TMX " + path.string() + ": " + parse.description());
    }

    return index_document(path.string(), error);
}

bool TmxDocument::load_string(const std::string& xml, Error& error) {
    source_path_.clear();

    const pugi::xml_parse_result parse = xml_.load_string(xml.c_str(), pugi::parse_default | pugi::parse_ws_pcdata);
    if (!parse) {
        return fail(error, ErrorCode::TmxReadFailure, std::string("Failed to parse TMX: ") + parse.description());
    }

    return index_document("<string>", error);
}

bool TmxDocument::index_document(const std::string& origin, Error& error) {
    languages_.clear();
    body_ = pugi::xml_node();

    const auto root = xml_.document_element();
    if (!root || local_name(root.name()) != "tmx") {
        return fail(error, ErrorCode::TmxReadFailure, "No <tmx> root element in " + origin);
    }

    body_ = find_child(root, "body");
    if (!body_) {
        return fail(error, ErrorCode::TmxReadFailure, "No <body> element in " + origin);
    }

    for (auto tu = next_tu(body_.first_child()); tu; tu = next_tu(tu.next_sibling())) {
        for (const auto& tuv : tu.children()) {
            if (tuv.type() != pugi::node_element || local_name(tuv.name()) != "tuv") {
                continue;
            }
            const std::string lang = tuv_language(tuv);
            if (!lang.empty() && std::find(languages_.begin(), languages_.end(), lang) == languages_.end()) {
                languages_.push_back(lang);
            }
        }
    }

    return true;
}

std::unique_ptr<TuStream> TmxDocument::stream() const {
    return std::make_unique<TmxTuStream>(body_);
}

}  // namespace tmx_cwb
