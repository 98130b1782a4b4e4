#include <gtest/gtest.h>

#include "mt/markdown/parser.hpp"
#include "mt/trace.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace mt::markdown;

namespace
{

std::vector<std::string> readLines(const std::filesystem::path &path)
{
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

} // namespace

// The trace switch is read once per process, so this suite enables it before
// anything else parses.
TEST(Trace, ConcurrentParsesWriteWholeLines)
{
    const auto logPath = std::filesystem::temp_directory_path() / "mt_trace_test.log";
    std::error_code ec;
    std::filesystem::remove(logPath, ec);
    ::setenv(mt::diag::kTraceEnvVar, "1", 1);
    ::setenv(mt::diag::kTraceLogEnvVar, logPath.c_str(), 1);
    ASSERT_TRUE(mt::diag::traceEnabled());

    const std::string input = "# Title\n\n- *a*\n- [b](/b)\n\n> **c** _d_\n";
    parse(input);
    const std::size_t perParse = readLines(logPath).size();
    ASSERT_GT(perParse, 0u);

    constexpr std::size_t kThreads = 4;
    constexpr std::size_t kParsesPerThread = 50;
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < kThreads; ++t)
        workers.emplace_back([&] {
            for (std::size_t n = 0; n < kParsesPerThread; ++n)
                parse(input);
        });
    for (auto &worker : workers)
        worker.join();

    const auto lines = readLines(logPath);
    EXPECT_EQ(lines.size(), perParse * (1 + kThreads * kParsesPerThread));
    for (const auto &line : lines)
    {
        EXPECT_EQ(line.rfind("[marktree][", 0), 0u) << line;
        EXPECT_EQ(line.find("[marktree]", 1), std::string::npos) << line;
    }

    std::filesystem::remove(logPath, ec);
}
