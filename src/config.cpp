#include "config.hpp"

#include "tokenizer.hpp"

#include <iostream>
#include <sstream>
#include <string>

namespace {

bool parse_command(const std::string& name, Command& out) {
    if (name == "to-cwb") {
        out = Command::ToCwb;
    } else if (name == "stage") {
        out = Command::Stage;
    } else if (name == "to-tmx") {
        out = Command::ToTmx;
    } else if (name == "staging-to-tmx") {
        out = Command::StagingToTmx;
    } else {
        return false;
    }
    return true;
}

bool validate(AppConfig& config, std::string& error) {
    switch (config.command) {
    case Command::ToCwb:
    case Command::Stage:
        if (config.tmx_path.empty()) {
            error = "--tmx is required";
            return false;
        }
        break;
    case Command::ToTmx:
        if (config.source_lang.empty() || config.target_lang.empty()) {
            error = "--source-lang and --target-lang are required";
            return false;
        }
        if (config.corpus_name.empty() && (config.source_corpus.empty() || config.target_corpus.empty())) {
            error = "Source and target corpora names are required (--source/--target or --corpus-name)";
            return false;
        }
        break;
    case Command::StagingToTmx:
        if (config.source_lang.empty() || config.target_lang.empty()) {
            error = "--source-lang and --target-lang are required";
            return false;
        }
        if (config.source_staging.empty() || config.target_staging.empty() || config.alignment_path.empty()) {
            error = "--source-staging, --target-staging and --alignment are required";
            return false;
        }
        break;
    }
    return true;
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " to-cwb --tmx <file> [options]          TMX -> aligned CWB corpora\n"
        << "  " << program_name << " stage --tmx <file> [options]           TMX -> staging files only\n"
        << "  " << program_name << " to-tmx --source <corpus> --target <corpus> --source-lang <l> --target-lang <l>\n"
        << "  " << program_name << " staging-to-tmx --source-staging <f> --target-staging <f> --alignment <f>\n"
        << "        --source-lang <l> --target-lang <l>\n\n"
        << "Import options:\n"
        << "  --from <lang>         Source language (default: detect)\n"
        << "  --to <lang>           Target language (default: detect)\n"
        << "  --corpora <dir>       Corpus data folder (default: /corpora)\n"
        << "  --corpus-name <name>  Corpus base name (default: TMX file name)\n"
        << "  --staging-dir <dir>   Where staging files are written (default: .)\n"
        << "  --tokenize-source     Tokenize the source side instead of splitting on spaces\n"
        << "  --tokenize-target     Tokenize the target side instead of splitting on spaces\n"
        << "  --keep-staging        Keep staging files after a successful import\n\n"
        << "Export options:\n"
        << "  --corpus-name <name>  Derive corpus names from base name and languages\n"
        << "  --output <file>       Output TMX (default: - for stdout)\n\n"
        << "Common options:\n"
        << "  --registry <dir>      CWB registry (default: $CORPUS_REGISTRY or cwb-config -r)\n"
        << "  --verbose             Report progress and relay CWB tool output\n"
        << "  -h, --help            Show this help\n\n"
        << "Tokenizers:\n";

    std::istringstream tokenizers(tmx_cwb::Tokenizer::lists());
    std::string line;
    while (std::getline(tokenizers, line)) {
        std::cout << "  " << line << "\n";
    }
    std::cout << "  (whitespace unless --tokenize-source/--tokenize-target selects rule)\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        error = "help";
        return false;
    }
    if (!parse_command(command, config.command)) {
        error = "Unknown command: " + command;
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--tmx") {
            config.tmx_path = require_value(arg);
        } else if (arg == "--from") {
            config.from_lang = require_value(arg);
        } else if (arg == "--to") {
            config.to_lang = require_value(arg);
        } else if (arg == "--corpora") {
            config.corpora_dir = require_value(arg);
        } else if (arg == "--corpus-name") {
            config.corpus_name = require_value(arg);
        } else if (arg == "--staging-dir") {
            config.staging_dir = require_value(arg);
        } else if (arg == "--tokenize-source") {
            config.tokenize_source = true;
        } else if (arg == "--tokenize-target") {
            config.tokenize_target = true;
        } else if (arg == "--keep-staging") {
            config.keep_staging = true;
        } else if (arg == "--source") {
            config.source_corpus = require_value(arg);
        } else if (arg == "--target") {
            config.target_corpus = require_value(arg);
        } else if (arg == "--source-lang") {
            config.source_lang = require_value(arg);
        } else if (arg == "--target-lang") {
            config.target_lang = require_value(arg);
        } else if (arg == "--source-staging") {
            config.source_staging = require_value(arg);
        } else if (arg == "--target-staging") {
            config.target_staging = require_value(arg);
        } else if (arg == "--alignment") {
            config.alignment_path = require_value(arg);
        } else if (arg == "--output") {
            config.output_path = require_value(arg);
        } else if (arg == "--registry") {
            config.registry = require_value(arg);
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    return validate(config, error);
}
