#include "CommandLine.h"
#include <algorithm>
#include <array>
#include <getopt.h>
#include <span>

namespace
{
    struct CommandSpelling
    {
        std::string_view name;
        std::string_view alias;
        CommandName command;
        std::size_t positionalCount;
        bool acceptsOutput;
    };

    constexpr auto commandSpellings = std::to_array<CommandSpelling>({
        { "encode", "e", CommandName::Encode, 2, true },
        { "decode", "d", CommandName::Decode, 1, false },
        { "remove", "rm", CommandName::Remove, 1, false },
        { "print", "p", CommandName::Print, 0, false } });

    const struct option longOptions[] = {
        { "input", required_argument, nullptr, 'i' },
        { "output", required_argument, nullptr, 'o' },
        { "help", no_argument, nullptr, 'h' },
        { nullptr, 0, nullptr, 0 }
    };

    constexpr bool IsHelpFlag(std::string_view argument) noexcept
    {
        return argument == "help" || argument == "-h" || argument == "--help";
    }
}

tl::expected<CommandLineArguments, std::string> ParseCommandLine(int argc, char* argv[])
{
    if(argc < 2)
        return tl::unexpected(std::string("No command given"));

    CommandLineArguments parsed;
    const std::string_view name = argv[1];
    if(IsHelpFlag(name))
        return parsed;

    auto spelling = std::find_if(commandSpellings.begin(), commandSpellings.end(), [&](const CommandSpelling& s)
        {
            return s.name == name || s.alias == name;
        });
    if(spelling == commandSpellings.end())
        return tl::unexpected("Unknown command: " + std::string(name));

    parsed.command = spelling->command;

    //getopt skips its first element, so the command name stands in for the program name
    const int commandArgc = argc - 1;
    char** commandArgv = argv + 1;

    //0 rather than 1 makes glibc reset its internal state between calls
    optind = 0;
    opterr = 0;

    std::optional<std::filesystem::path> input;
    int opt;
    while((opt = getopt_long(commandArgc, commandArgv, ":i:o:h", longOptions, nullptr)) != -1)
    {
        switch(opt)
        {
        case 'i':
            input = std::filesystem::path{ optarg };
            break;
        case 'o':
            if(!spelling->acceptsOutput)
                return tl::unexpected("-o/--output is not accepted by " + std::string(spelling->name));
            parsed.output = std::filesystem::path{ optarg };
            break;
        case 'h':
            parsed.command = CommandName::Help;
            return parsed;
        case ':':
            return tl::unexpected("Missing path after " + std::string(commandArgv[optind - 1]));
        case '?':
        default:
            return tl::unexpected("Unknown option: " + std::string(commandArgv[optind - 1]));
        }
    }

    if(!input)
        return tl::unexpected("Missing required -i <path> for " + std::string(spelling->name));

    const std::span<char*> positionals{ commandArgv + optind, commandArgv + commandArgc };
    if(positionals.size() != spelling->positionalCount)
        return tl::unexpected("Wrong number of arguments for " + std::string(spelling->name));

    parsed.input = std::move(input).value();
    if(positionals.size() > 0)
        parsed.chunkType = positionals[0];
    if(positionals.size() > 1)
        parsed.message = positionals[1];

    return parsed;
}

std::string_view UsageText() noexcept
{
    return
        "Usage:\n"
        "  pngstash encode|e  -i <path> <chunk_type> <message> [-o <out_path>]\n"
        "  pngstash decode|d  -i <path> <chunk_type>\n"
        "  pngstash remove|rm -i <path> <chunk_type>\n"
        "  pngstash print|p   -i <path>\n"
        "  pngstash help\n"
        "Use -- before a message that starts with '-'.\n";
}
