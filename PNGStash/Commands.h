#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "Chunk.h"
#include "PlatformDetection.h"

namespace Commands
{
    struct ChunkSummary
    {
        std::string type;
        std::string_view standardName;
        bool critical;
        bool isPublic;
        bool safeToCopy;
        std::uint32_t length;
        std::uint32_t crc;
        std::string description;
    };

    struct RemovedChunk
    {
        std::vector<Byte> file;
        Chunk chunk;
    };

    /// <summary>
    /// Appends a chunk holding message to the end of the file.
    /// Types that are not 4 letters or have the reserved bit set are rejected,
    /// as is a message too long for the chunk length field.
    /// </summary>
    AnyError<std::vector<Byte>> Encode(std::span<const Byte> file, std::string_view chunkType, std::string_view message);

    //Malformed types fail with Invalid_Chunk_Type before the file is searched
    AnyError<std::string> Decode(std::span<const Byte> file, std::string_view chunkType);

    AnyError<RemovedChunk> RemoveChunk(std::span<const Byte> file, std::string_view chunkType);
    AnyError<std::vector<Byte>> Remove(std::span<const Byte> file, std::string_view chunkType);

    AnyError<std::vector<ChunkSummary>> Print(std::span<const Byte> file);

    std::string FormatSummary(const ChunkSummary& summary);
}
