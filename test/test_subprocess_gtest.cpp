#include <gtest/gtest.h>

#include "subprocess.hpp"

#include <string>
#include <vector>

using namespace tmx_cwb;

TEST(SubprocessTest, DeliversStdoutLineByLine) {
    std::vector<std::string> lines;
    ToolResult result;
    std::string error;
    ASSERT_TRUE(run_tool(
        {"/bin/sh", "-c", "printf 'o\\ngato\\npreto'"},
        [&](const std::string& line) { lines.push_back(line); },
        result,
        error
    )) << error;

    EXPECT_TRUE(result.success());
    EXPECT_EQ(lines, (std::vector<std::string>{"o", "gato", "preto"}));
}

TEST(SubprocessTest, ReportsExitStatus) {
    ToolResult result;
    std::string error;
    ASSERT_TRUE(run_tool({"/bin/sh", "-c", "exit 3"}, {}, result, error)) << error;
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_status, 3);
    EXPECT_EQ(result.describe(), "exit status 3");
}

TEST(SubprocessTest, MissingProgramExits127) {
    ToolResult result;
    std::string error;
    ASSERT_TRUE(run_tool({"tmx-cwb-no-such-tool"}, {}, result, error)) << error;
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_status, 127);
}

TEST(SubprocessTest, ReportsSignals) {
    ToolResult result;
    std::string error;
    ASSERT_TRUE(run_tool({"/bin/sh", "-c", "kill -9 $$"}, {}, result, error)) << error;
    EXPECT_TRUE(result.signaled);
    EXPECT_EQ(result.signal, 9);
    EXPECT_FALSE(result.success());
}

TEST(SubprocessTest, EmptyCommandLineIsRejected) {
    ToolResult result;
    std::string error;
    EXPECT_FALSE(run_tool({}, {}, result, error));
    EXPECT_FALSE(error.empty());
}

TEST(SubprocessTest, DescribesCommandLine) {
    EXPECT_EQ(describe_command({"cwb-make", "-r", "/reg", "-V", "FOO_PT"}), "cwb-make -r /reg -V FOO_PT");
}
