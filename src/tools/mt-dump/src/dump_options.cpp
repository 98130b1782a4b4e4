#include "dump_options.hpp"

#include <cstdint>
#include <string_view>

namespace mt::dump
{
namespace
{

OutputFormat formatFromName(const std::string &name)
{
    if (name == "outline")
        return OutputFormat::Outline;
    if (name == "markdown")
        return OutputFormat::Markdown;
    return OutputFormat::Json;
}

struct ValueFlag
{
    std::string_view flag;
    const char *option;
};

constexpr ValueFlag kValueFlags[] = {
    {"--format", kOptionFormat},
    {"--max-depth", kOptionMaxNestingDepth},
    {"--indent", kOptionJsonIndent},
};

} // namespace

void registerDumpOptions(config::OptionRegistry &registry)
{
    config::OptionDefinition depth{kOptionMaxNestingDepth, config::OptionKind::Integer,
                                   config::OptionValue(static_cast<std::int64_t>(64)), "Maximum Nesting Depth",
                                   "Deepest container or link nesting accepted before parsing fails."};
    depth.minimum = 1;
    depth.maximum = 4096;
    registry.registerOption(depth);

    config::OptionDefinition format{kOptionFormat, config::OptionKind::String, config::OptionValue("json"),
                                    "Output Format", "One of json, outline or markdown."};
    format.choices = {"json", "outline", "markdown"};
    registry.registerOption(format);

    config::OptionDefinition indent{kOptionJsonIndent, config::OptionKind::Integer,
                                    config::OptionValue(static_cast<std::int64_t>(2)), "JSON Indent",
                                    "Spaces per JSON nesting level; -1 prints compact JSON."};
    indent.minimum = -1;
    indent.maximum = 16;
    registry.registerOption(indent);

    registry.registerOption({kOptionDocumentOffsets, config::OptionKind::Boolean, config::OptionValue(false),
                             "Document Offsets",
                             "Report locations in document coordinates instead of container coordinates."});
}

DumpSettings settingsFrom(const config::OptionRegistry &registry)
{
    DumpSettings settings;
    settings.parser.maxNestingDepth = static_cast<std::size_t>(registry.getInteger(kOptionMaxNestingDepth, 64));
    settings.format = formatFromName(registry.getString(kOptionFormat, "json"));
    settings.jsonIndent = static_cast<int>(registry.getInteger(kOptionJsonIndent, 2));
    settings.documentOffsets = registry.getBool(kOptionDocumentOffsets, false);
    return settings;
}

bool parseCommandLine(const std::vector<std::string> &args, config::OptionRegistry &registry,
                      CommandLine &commandLine, std::string &error)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--help" || arg == "-h")
        {
            commandLine.showHelp = true;
            continue;
        }
        if (arg == "--version")
        {
            commandLine.showVersion = true;
            continue;
        }
        if (arg == "--save-defaults")
        {
            commandLine.saveDefaults = true;
            continue;
        }
        if (arg == "--document-offsets")
        {
            registry.set(kOptionDocumentOffsets, config::OptionValue(true));
            continue;
        }

        bool matched = false;
        for (const ValueFlag &flag : kValueFlags)
        {
            std::string_view view(arg);
            std::string value;
            if (view == flag.flag)
            {
                if (i + 1 >= args.size())
                {
                    error = std::string(flag.flag) + " requires a value";
                    return false;
                }
                value = args[++i];
            }
            else if (view.size() > flag.flag.size() && view.substr(0, flag.flag.size()) == flag.flag &&
                     view[flag.flag.size()] == '=')
            {
                value = std::string(view.substr(flag.flag.size() + 1));
            }
            else
            {
                continue;
            }

            if (!registry.set(flag.option, config::OptionValue(value)))
            {
                error = "invalid value '" + value + "' for " + std::string(flag.flag);
                return false;
            }
            matched = true;
            break;
        }
        if (matched)
            continue;

        if (arg.size() > 1 && arg[0] == '-')
        {
            error = "unknown option " + arg;
            return false;
        }
        if (commandLine.inputPath)
        {
            error = "only one input file may be given";
            return false;
        }
        commandLine.inputPath = arg;
    }
    return true;
}

} // namespace mt::dump
