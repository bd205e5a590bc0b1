#include "subprocess.hpp"

#include <cerrno>
#include <cstring>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tmx_cwb {
namespace {

void deliver_lines(std::string& buf, const LineCallback& callback, bool flush_tail) {
    std::size_t pos = 0;
    while (true) {
        const std::size_t nl = buf.find('\n', pos);
        if (nl == std::string::npos) {
            break;
        }
        if (callback) {
            callback(buf.substr(pos, nl - pos));
        }
        pos = nl + 1;
    }
    buf.erase(0, pos);

    if (flush_tail && !buf.empty()) {
        if (callback) {
            callback(buf);
        }
        buf.clear();
    }
}

}  // namespace

std::string ToolResult::describe() const {
    if (signaled) {
        return "killed by signal " + std::to_string(signal);
    }
    if (exit_status == 127) {
        return "exit status 127 (command not found?)";
    }
    return "exit status " + std::to_string(exit_status);
}

std::string describe_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += arg;
    }
    return out;
}

bool run_tool(
    const std::vector<std::string>& args,
    const LineCallback& on_stdout_line,
    ToolResult& result,
    std::string& error
) {
    result = ToolResult{};

    if (args.empty()) {
        error = "empty command line";
        return false;
    }

    std::vector<std::string> owned = args;
    std::vector<char*> cargs;
    cargs.reserve(owned.size() + 1);
    for (std::string& s : owned) {
        cargs.push_back(s.data());
    }
    cargs.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if (pipe(pipefd) != 0) {
        error = std::string("pipe() failed: ") + std::strerror(errno);
        return false;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        error = std::string("fork() failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        execvp(cargs[0], cargs.data());
        _exit(127);
    }

    close(pipefd[1]);

    std::string buf;
    char chunk[4096];
    while (true) {
        const ssize_t n = read(pipefd[0], chunk, sizeof(chunk));
        if (n > 0) {
            buf.append(chunk, static_cast<std::size_t>(n));
            deliver_lines(buf, on_stdout_line, false);
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(pipefd[0]);
    deliver_lines(buf, on_stdout_line, true);

    int wait_status = 0;
    while (waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR) {
            error = std::string("waitpid() failed: ") + std::strerror(errno);
            return false;
        }
    }

    if (WIFSIGNALED(wait_status)) {
        result.signaled = true;
        result.signal = WTERMSIG(wait_status);
    } else if (WIFEXITED(wait_status)) {
        result.exit_status = WEXITSTATUS(wait_status);
    }
    return true;
}

}  // namespace tmx_cwb
