#pragma once

#include <functional>
#include <string>
#include <vector>

namespace tmx_cwb {

struct ToolResult {
    int exit_status = -1;
    bool signaled = false;
    int signal = 0;

    bool success() const { return !signaled && exit_status == 0; }
    std::string describe() const;
};

using LineCallback = std::function<void(const std::string& line)>;

// Runs args[0] (looked up in PATH) to completion. Standard output is
// delivered line by line to `on_stdout_line`; standard error is inherited.
// Returns false only when the process could not be started; the exit
// status is reported through `result`.
bool run_tool(
    const std::vector<std::string>& args,
    const LineCallback& on_stdout_line,
    ToolResult& result,
    std::string& error
);

std::string describe_command(const std::vector<std::string>& args);

}  // namespace tmx_cwb
