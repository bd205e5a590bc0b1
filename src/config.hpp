#pragma once

#include <filesystem>
#include <string>

enum class Command {
    ToCwb,
    Stage,
    ToTmx,
    StagingToTmx
};

struct AppConfig {
    Command command = Command::ToCwb;

    // to-cwb / stage
    std::filesystem::path tmx_path;
    std::string from_lang;
    std::string to_lang;
    std::filesystem::path corpora_dir = "/corpora";
    std::string corpus_name;
    std::filesystem::path staging_dir = ".";
    bool tokenize_source = false;
    bool tokenize_target = false;
    bool keep_staging = false;

    // to-tmx / staging-to-tmx
    std::string source_corpus;
    std::string target_corpus;
    std::string source_lang;
    std::string target_lang;
    std::filesystem::path source_staging;
    std::filesystem::path target_staging;
    std::filesystem::path alignment_path;
    std::filesystem::path output_path = "-";

    std::string registry;
    bool verbose = false;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);
