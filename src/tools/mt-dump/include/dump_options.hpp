#pragma once

#include "mt/markdown/parse_error.hpp"
#include "mt/options.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mt::dump
{

inline constexpr char kOptionMaxNestingDepth[] = "maxNestingDepth";
inline constexpr char kOptionFormat[] = "format";
inline constexpr char kOptionJsonIndent[] = "jsonIndent";
inline constexpr char kOptionDocumentOffsets[] = "documentOffsets";

enum class OutputFormat
{
    Json,
    Outline,
    Markdown
};

struct DumpSettings
{
    markdown::ParserOptions parser;
    OutputFormat format = OutputFormat::Json;
    int jsonIndent = 2;
    bool documentOffsets = false;
};

struct CommandLine
{
    bool showHelp = false;
    bool showVersion = false;
    bool saveDefaults = false;
    // Unset or "-" reads standard input.
    std::optional<std::string> inputPath;
};

void registerDumpOptions(config::OptionRegistry &registry);

DumpSettings settingsFrom(const config::OptionRegistry &registry);

// Applies command line flags on top of the registry. Returns false and fills
// `error` on a usage error.
bool parseCommandLine(const std::vector<std::string> &args, config::OptionRegistry &registry,
                      CommandLine &commandLine, std::string &error);

} // namespace mt::dump
