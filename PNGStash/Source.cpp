#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include "CommandLine.h"
#include "Commands.h"
#include "FileIO.h"

namespace
{
    constexpr int exitSuccess = 0;
    constexpr int exitFailure = 1;
    constexpr int exitUsage = 2;

    int ReportError(PNGError error)
    {
        std::cerr << "error: " << ToString(error) << "\n";
        return exitFailure;
    }

    int RunEncode(const CommandLineArguments& arguments)
    {
        AnyError<void> result = ReadFile(arguments.input)
            .and_then([&](std::vector<Byte> file)
                {
                    return Commands::Encode(file, arguments.chunkType, arguments.message);
                })
            .and_then([&](std::vector<Byte> encoded)
                {
                    return WriteFile(arguments.output.value_or(arguments.input), encoded);
                });

        if(!result)
            return ReportError(result.error());
        return exitSuccess;
    }

    int RunDecode(const CommandLineArguments& arguments)
    {
        AnyError<std::string> message = ReadFile(arguments.input)
            .and_then([&](std::vector<Byte> file)
                {
                    return Commands::Decode(file, arguments.chunkType);
                });

        if(!message)
            return ReportError(message.error());

        std::cout << message.value() << "\n";
        return exitSuccess;
    }

    int RunRemove(const CommandLineArguments& arguments)
    {
        AnyError<Commands::RemovedChunk> removed = ReadFile(arguments.input)
            .and_then([&](std::vector<Byte> file)
                {
                    return Commands::RemoveChunk(file, arguments.chunkType);
                });

        if(!removed)
            return ReportError(removed.error());

        if(auto value = WriteFile(arguments.input, removed->file); !value)
            return ReportError(value.error());

        if(auto text = removed->chunk.DataAsString(); text)
            std::cout << "Removed " << arguments.chunkType << " chunk with content \"" << text.value() << "\"\n";
        else
            std::cout << "Removed " << arguments.chunkType << " chunk of " << removed->chunk.Length() << " bytes\n";
        return exitSuccess;
    }

    int RunPrint(const CommandLineArguments& arguments)
    {
        AnyError<std::vector<Commands::ChunkSummary>> summaries = ReadFile(arguments.input)
            .and_then([](std::vector<Byte> file)
                {
                    return Commands::Print(file);
                });

        if(!summaries)
            return ReportError(summaries.error());

        for(const Commands::ChunkSummary& summary : summaries.value())
        {
            std::cout << Commands::FormatSummary(summary) << "\n";
        }
        return exitSuccess;
    }
}

int main(int argc, char* argv[])
{
    auto parsed = ParseCommandLine(argc, argv);
    if(!parsed)
    {
        std::cerr << "error: " << parsed.error() << "\n" << UsageText();
        return exitUsage;
    }

    switch(parsed->command)
    {
    case CommandName::Encode:
        return RunEncode(parsed.value());
    case CommandName::Decode:
        return RunDecode(parsed.value());
    case CommandName::Remove:
        return RunRemove(parsed.value());
    case CommandName::Print:
        return RunPrint(parsed.value());
    case CommandName::Help:
        std::cout << UsageText();
        return exitSuccess;
    }

    return exitUsage;
}
