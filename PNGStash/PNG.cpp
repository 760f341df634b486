#include "PNG.h"
#include <algorithm>
#include <numeric>
#include <utility>

namespace
{
    bool HasType(const Chunk& chunk, std::string_view chunkType) noexcept
    {
        const Bytes<4>& bytes = chunk.Type().AsBytes();
        return chunkType.size() == bytes.size()
            && std::equal(bytes.begin(), bytes.end(), chunkType.begin(), [](Byte b, char c) { return b == static_cast<Byte>(c); });
    }

    tl::expected<void, ParseFailure> VerifySignature(ByteInputStream& stream)
    {
        auto signature = stream.Read<PNGSignature.size()>();
        if(!signature || signature.value() != PNGSignature)
        {
            return tl::unexpected(ParseFailure{ PNGError::Unknown_Signature, 0 });
        }
        return {};
    }
}

PNG PNG::FromChunks(std::vector<Chunk> chunks)
{
    PNG png;
    png.m_chunks = std::move(chunks);
    return png;
}

tl::expected<PNG, ParseFailure> PNG::Parse(std::span<const Byte> bytes)
{
    ByteInputStream stream{ bytes };

    if(auto value = VerifySignature(stream); !value)
        return tl::unexpected(std::move(value).error());

    PNG png;
    while(stream.HasUnreadData())
    {
        if(auto value = Chunk::Parse(stream); value)
            png.m_chunks.push_back(std::move(value).value());
        else
            return tl::unexpected(ParseFailure{ std::move(value).error(), stream.Offset() });
    }

    return png;
}

void PNG::AppendChunk(Chunk chunk)
{
    m_chunks.push_back(std::move(chunk));
}

AnyError<Chunk> PNG::RemoveFirstChunk(std::string_view chunkType)
{
    auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [chunkType](const Chunk& chunk) { return HasType(chunk, chunkType); });
    if(it == m_chunks.end())
        return tl::unexpected(PNGError::Chunk_Not_Found);

    Chunk removed = std::move(*it);
    m_chunks.erase(it);
    return removed;
}

const Chunk* PNG::ChunkByType(std::string_view chunkType) const noexcept
{
    auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [chunkType](const Chunk& chunk) { return HasType(chunk, chunkType); });
    if(it == m_chunks.end())
        return nullptr;

    return &*it;
}

std::size_t PNG::SerializedSize() const noexcept
{
    return std::accumulate(m_chunks.begin(), m_chunks.end(), standardHeader.size(), [](std::size_t val, const Chunk& c) { return val + c.SerializedSize(); });
}

std::vector<Byte> PNG::AsBytes() const
{
    ByteOutputStream stream{ SerializedSize() };
    stream.Write(standardHeader);
    for(const Chunk& chunk : m_chunks)
    {
        chunk.Write(stream);
    }
    return std::move(stream).Release();
}
