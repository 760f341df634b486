#pragma once
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>
#include "Chunk.h"
#include "PlatformDetection.h"

struct ParseFailure
{
    PNGError error;
    //Position in the buffer of the signature or chunk that failed to parse
    std::size_t offset;
};

/// <summary>
/// The PNG signature followed by an ordered list of chunks.
/// Chunk order is kept exactly as parsed or inserted, no rendering order rules are enforced.
/// </summary>
class PNG
{
    std::vector<Chunk> m_chunks;

public:
    static constexpr Bytes<8> standardHeader = PNGSignature;

public:
    PNG() = default;

    static PNG FromChunks(std::vector<Chunk> chunks);

    /// <summary>
    /// Parses the signature and then chunks until the buffer is exhausted.
    /// The first bad chunk fails the whole parse.
    /// </summary>
    static tl::expected<PNG, ParseFailure> Parse(std::span<const Byte> bytes);

public:
    void AppendChunk(Chunk chunk);

    //Only the first chunk with a matching type is removed
    AnyError<Chunk> RemoveFirstChunk(std::string_view chunkType);

    const Chunk* ChunkByType(std::string_view chunkType) const noexcept;

    std::span<const Chunk> Chunks() const noexcept { return m_chunks; }

    std::size_t SerializedSize() const noexcept;
    std::vector<Byte> AsBytes() const;
};
