#include "dump_options.hpp"
#include "outline.hpp"

#include "mt/markdown/json_export.hpp"
#include "mt/markdown/parser.hpp"
#include "mt/markdown/serializer.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#ifndef MT_DUMP_VERSION
#define MT_DUMP_VERSION "0.0.0"
#endif

namespace
{

constexpr char kAppName[] = "mt-dump";

void printHelp()
{
    std::cout << kAppName << " - Parse markdown and print its structure\n\n";
    std::cout << "Usage: " << kAppName
              << " [--format json|outline|markdown] [--max-depth N] [--indent N] [--document-offsets]"
                 " [--save-defaults] [FILE]\n\n";
    std::cout << "Reads FILE (or standard input when FILE is omitted or '-') and prints the parsed tree.\n";
    std::cout << "  --format            json (default), outline, or canonical markdown\n";
    std::cout << "  --max-depth N       nesting ceiling for containers and link text (default 64)\n";
    std::cout << "  --indent N          JSON indent, -1 for compact output (default 2)\n";
    std::cout << "  --document-offsets  report locations in document coordinates\n";
    std::cout << "  --save-defaults     store the effective options as this tool's defaults\n";
    std::cout << "  --version           print the version and exit" << std::endl;
}

bool readInput(const std::optional<std::string> &path, std::string &content)
{
    if (!path || *path == "-")
    {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return !std::cin.bad();
    }

    std::ifstream in(*path, std::ios::binary);
    if (!in)
        return false;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    content = buffer.str();
    return !in.bad();
}

} // namespace

int main(int argc, char **argv)
{
    mt::config::OptionRegistry registry(kAppName);
    mt::dump::registerDumpOptions(registry);
    registry.loadDefaults();

    std::vector<std::string> args(argv + 1, argv + argc);
    mt::dump::CommandLine commandLine;
    std::string error;
    if (!mt::dump::parseCommandLine(args, registry, commandLine, error))
    {
        std::cerr << "[" << kAppName << "] " << error << "\n";
        std::cerr << "Try '" << kAppName << " --help' for more information." << std::endl;
        return 2;
    }
    if (commandLine.showHelp)
    {
        printHelp();
        return 0;
    }
    if (commandLine.showVersion)
    {
        std::cout << kAppName << " " << MT_DUMP_VERSION << std::endl;
        return 0;
    }
    if (commandLine.saveDefaults && !registry.saveDefaults())
    {
        std::cerr << "[" << kAppName << "] failed to write " << registry.defaultOptionsPath().string() << std::endl;
        return 1;
    }

    std::string content;
    if (!readInput(commandLine.inputPath, content))
    {
        std::cerr << "[" << kAppName << "] cannot read " << commandLine.inputPath.value_or("standard input")
                  << std::endl;
        return 1;
    }

    const mt::dump::DumpSettings settings = mt::dump::settingsFrom(registry);
    mt::markdown::Document document;
    try
    {
        document = mt::markdown::parse(content, settings.parser);
    }
    catch (const mt::markdown::ParseError &ex)
    {
        std::cerr << "[" << kAppName << "] parse error: " << ex.what() << std::endl;
        return 1;
    }

    switch (settings.format)
    {
    case mt::dump::OutputFormat::Json:
    {
        mt::markdown::JsonExportOptions options;
        options.documentOffsets = settings.documentOffsets;
        // Input bytes are not validated as UTF-8; replace bad sequences instead of throwing.
        std::cout << mt::markdown::toJson(document, options)
                         .dump(settings.jsonIndent, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        break;
    }
    case mt::dump::OutputFormat::Outline:
        std::cout << mt::dump::formatOutline(document, settings.documentOffsets);
        break;
    case mt::dump::OutputFormat::Markdown:
        std::cout << mt::markdown::toMarkdown(document);
        break;
    }
    return std::cout ? 0 : 1;
}
