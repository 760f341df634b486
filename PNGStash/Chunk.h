#pragma once
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <vector>
#include "ByteStream.h"
#include "ChunkType.h"
#include "PlatformDetection.h"

/// <summary>
/// One length prefixed, CRC checked record of a PNG file.
/// The data is opaque, the length is always the size of the data.
/// </summary>
class Chunk
{
    ChunkType m_type;
    std::vector<Byte> m_data;
    std::uint32_t m_crc = 0;

public:
    //length, type and crc fields around the data
    static constexpr std::size_t overheadSize = 12;
    static constexpr std::size_t maxDataSize = std::numeric_limits<std::uint32_t>::max();

public:
    Chunk(ChunkType type, std::vector<Byte> data);

private:
    Chunk(ChunkType type, std::vector<Byte> data, std::uint32_t crc);

public:
    /// <summary>
    /// Reads length, type, data and CRC from the stream.
    /// On failure the stream is left at the start of the chunk.
    /// </summary>
    static AnyError<Chunk> Parse(ByteInputStream& stream);
    static AnyError<Chunk> Parse(std::span<const Byte> bytes);

public:
    static constexpr bool FitsInChunk(std::size_t dataSize) noexcept { return dataSize <= maxDataSize; }

public:
    std::uint32_t Length() const noexcept { return static_cast<std::uint32_t>(m_data.size()); }
    const ChunkType& Type() const noexcept { return m_type; }
    std::span<const Byte> Data() const noexcept { return m_data; }
    std::uint32_t CRC() const noexcept { return m_crc; }
    std::size_t SerializedSize() const noexcept { return overheadSize + m_data.size(); }

    AnyError<std::string> DataAsString() const;

    std::vector<Byte> AsBytes() const;
    void Write(ByteOutputStream& stream) const;

    //Data is shown as text when it is valid UTF-8, as a byte list otherwise
    std::string Describe() const;
};
