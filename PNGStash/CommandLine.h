#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <tl/expected.hpp>

enum class CommandName
{
    Encode,
    Decode,
    Remove,
    Print,
    Help
};

struct CommandLineArguments
{
    CommandName command = CommandName::Help;
    std::filesystem::path input;
    //Only used by encode, the input file is overwritten when absent
    std::optional<std::filesystem::path> output;
    std::string chunkType;
    std::string message;
};

/// <summary>
/// Parses the arguments handed to main, argv[0] being the program name.
/// Options after the command are read with getopt_long, which may reorder argv.
/// </summary>
/// <returns>The reason the arguments were rejected on failure</returns>
tl::expected<CommandLineArguments, std::string> ParseCommandLine(int argc, char* argv[]);

std::string_view UsageText() noexcept;
