#include "mt/trace.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>

namespace mt::diag
{
namespace
{

std::ostream *openTraceStream()
{
    static std::ofstream log;
    const char *path = std::getenv(kTraceLogEnvVar);
    if (!path || !*path)
        return &std::cerr;
    log.open(path, std::ios::app);
    if (!log)
    {
        std::cerr << "[marktree] failed to open trace log at '" << path << "'\n";
        return &std::cerr;
    }
    return &log;
}

std::mutex &traceMutex()
{
    static std::mutex mutex;
    return mutex;
}

} // namespace

bool traceEnabled()
{
    static const bool enabled = [] {
        const char *value = std::getenv(kTraceEnvVar);
        return value && *value && *value != '0';
    }();
    return enabled;
}

void traceLine(std::string_view line)
{
    std::lock_guard<std::mutex> lock(traceMutex());
    static std::ostream *stream = openTraceStream();
    *stream << line << '\n';
    stream->flush();
}

} // namespace mt::diag
