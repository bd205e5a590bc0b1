#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

// Shell stand-ins for the CWB command line tools. Each one appends its
// command line to calls.log; cwb-decode also prints words.txt. The
// directory is put in front of PATH for the lifetime of the object.
class FakeCwbTools {
public:
    explicit FakeCwbTools(const std::string& tag)
        : dir_(std::filesystem::temp_directory_path() / ("tmx_cwb_tools_" + tag + "_" + std::to_string(::getpid()))) {
        std::filesystem::create_directories(dir_);
        log_ = dir_ / "calls.log";
        words_ = dir_ / "words.txt";

        for (const char* tool : {"cwb-encode", "cwb-make", "cwb-align-import"}) {
            install(tool, "");
        }
        install("cwb-decode", "cat \"" + words_.string() + "\"\n");

        if (const char* path = std::getenv("PATH")) {
            saved_path_ = path;
            had_path_ = true;
        }
        const std::string path = dir_.string() + (had_path_ ? ":" + saved_path_ : std::string());
        ::setenv("PATH", path.c_str(), 1);
    }

    ~FakeCwbTools() {
        if (had_path_) {
            ::setenv("PATH", saved_path_.c_str(), 1);
        } else {
            ::unsetenv("PATH");
        }
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    FakeCwbTools(const FakeCwbTools&) = delete;
    FakeCwbTools& operator=(const FakeCwbTools&) = delete;

    void set_words(const std::string& text) const {
        std::ofstream out(words_, std::ios::binary);
        out << text;
    }

    std::vector<std::string> calls() const {
        std::vector<std::string> lines;
        std::ifstream in(log_);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    const std::filesystem::path& dir() const { return dir_; }

private:
    void install(const std::string& tool, const std::string& body) const {
        const auto script = dir_ / tool;
        {
            std::ofstream out(script);
            out << "#!/bin/sh\n"
                << "printf '%s\\n' \"" << tool << " $*\" >> \"" << log_.string() << "\"\n"
                << body
                << "exit 0\n";
        }
        std::filesystem::permissions(script,
            std::filesystem::perms::owner_all | std::filesystem::perms::group_read
                | std::filesystem::perms::group_exec | std::filesystem::perms::others_read
                | std::filesystem::perms::others_exec);
    }

    std::filesystem::path dir_;
    std::filesystem::path log_;
    std::filesystem::path words_;
    std::string saved_path_;
    bool had_path_ = false;
};
