#include "Commands.h"
#include <iomanip>
#include <sstream>
#include <utility>
#include "PNG.h"

namespace Commands
{
    namespace
    {
        AnyError<PNG> ParseFile(std::span<const Byte> file)
        {
            return PNG::Parse(file).map_error([](const ParseFailure& failure) { return failure.error; });
        }

        AnyError<ChunkType> EncodableType(std::string_view chunkType)
        {
            return ChunkType::FromString(chunkType).and_then([](ChunkType type) -> AnyError<ChunkType>
                {
                    if(!type.IsReservedBitValid())
                        return tl::unexpected(PNGError::Reserved_Bit_Invalid);
                    return type;
                });
        }
    }

    AnyError<std::vector<Byte>> Encode(std::span<const Byte> file, std::string_view chunkType, std::string_view message)
    {
        PNG png;
        if(auto value = ParseFile(file); value)
            png = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        ChunkType type;
        if(auto value = EncodableType(chunkType); value)
            type = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        if(!Chunk::FitsInChunk(message.size()))
            return tl::unexpected(PNGError::Data_Too_Large);

        png.AppendChunk(Chunk{ type, std::vector<Byte>(message.begin(), message.end()) });
        return png.AsBytes();
    }

    AnyError<std::string> Decode(std::span<const Byte> file, std::string_view chunkType)
    {
        ChunkType type;
        if(auto value = ChunkType::FromString(chunkType); value)
            type = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        return ParseFile(file).and_then([&type](const PNG& png) -> AnyError<std::string>
            {
                const Chunk* chunk = png.ChunkByType(type.ToString());
                if(!chunk)
                    return tl::unexpected(PNGError::Chunk_Not_Found);

                return chunk->DataAsString();
            });
    }

    AnyError<RemovedChunk> RemoveChunk(std::span<const Byte> file, std::string_view chunkType)
    {
        ChunkType type;
        if(auto value = ChunkType::FromString(chunkType); value)
            type = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        return ParseFile(file).and_then([&type](PNG png) -> AnyError<RemovedChunk>
            {
                if(auto value = png.RemoveFirstChunk(type.ToString()); value)
                    return RemovedChunk{ png.AsBytes(), std::move(value).value() };
                else
                    return tl::unexpected(std::move(value).error());
            });
    }

    AnyError<std::vector<Byte>> Remove(std::span<const Byte> file, std::string_view chunkType)
    {
        return RemoveChunk(file, chunkType).map([](RemovedChunk removed) { return std::move(removed.file); });
    }

    AnyError<std::vector<ChunkSummary>> Print(std::span<const Byte> file)
    {
        return ParseFile(file).map([](const PNG& png)
            {
                std::vector<ChunkSummary> summaries;
                summaries.reserve(png.Chunks().size());
                for(const Chunk& chunk : png.Chunks())
                {
                    const ChunkType& type = chunk.Type();
                    summaries.push_back({
                        .type = type.ToString(),
                        .standardName = StandardChunkName(type),
                        .critical = type.IsCritical(),
                        .isPublic = type.IsPublic(),
                        .safeToCopy = type.IsSafeToCopy(),
                        .length = chunk.Length(),
                        .crc = chunk.CRC(),
                        .description = chunk.Describe() });
                }
                return summaries;
            });
    }

    std::string FormatSummary(const ChunkSummary& summary)
    {
        std::ostringstream line;
        line << summary.type
            << (summary.critical ? "  critical " : "  ancillary")
            << (summary.isPublic ? "  public " : "  private")
            << (summary.safeToCopy ? "  safe-to-copy  " : "  unsafe-to-copy")
            << "  length: " << summary.length
            << "  crc: 0x" << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << summary.crc;

        if(!summary.standardName.empty())
            line << "  (" << summary.standardName << ')';

        line << '\n' << summary.description;

        return line.str();
    }
}
