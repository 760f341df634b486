#include "Chunk.h"
#include <sstream>
#include <utility>
#include "CRC.h"
#include "ScopeGuard.h"
#include "UTF8.h"

Chunk::Chunk(ChunkType type, std::vector<Byte> data) :
    m_type(type),
    m_data(std::move(data)),
    m_crc(ChunkCRC(m_type.AsBytes(), m_data))
{
}

Chunk::Chunk(ChunkType type, std::vector<Byte> data, std::uint32_t crc) :
    m_type(type),
    m_data(std::move(data)),
    m_crc(crc)
{
}

AnyError<Chunk> Chunk::Parse(ByteInputStream& stream)
{
    ScopeGuard rewind = [&stream, chunkStart = stream.Offset()]
    {
        stream.Seek(chunkStart);
    };

    std::uint32_t length;
    if(auto value = stream.ReadNative<std::uint32_t>(); value)
        length = std::move(value).value();
    else
        return tl::unexpected(std::move(value).error());

    ChunkType type;
    if(auto value = stream.Read<4>(); value)
        type = ChunkType::FromBytes(std::move(value).value());
    else
        return tl::unexpected(std::move(value).error());

    std::vector<Byte> data;
    if(auto value = stream.Read(length); value)
        data.assign(value->begin(), value->end());
    else
        return tl::unexpected(std::move(value).error());

    std::uint32_t crc;
    if(auto value = stream.ReadNative<std::uint32_t>(); value)
        crc = std::move(value).value();
    else
        return tl::unexpected(std::move(value).error());

    //Checked before the type so a corrupted type byte is reported as corruption
    if(ChunkCRC(type.AsBytes(), data) != crc)
        return tl::unexpected(PNGError::Crc_Mismatch);

    //A set reserved bit is still decodable, only the letters are enforced here
    if(!type.IsAlphabetic())
        return tl::unexpected(PNGError::Invalid_Chunk_Type);

    rewind.Disengage();
    return Chunk{ type, std::move(data), crc };
}

AnyError<Chunk> Chunk::Parse(std::span<const Byte> bytes)
{
    ByteInputStream stream{ bytes };
    return Parse(stream);
}

AnyError<std::string> Chunk::DataAsString() const
{
    return UTF8::ToString(m_data);
}

std::vector<Byte> Chunk::AsBytes() const
{
    ByteOutputStream stream{ SerializedSize() };
    Write(stream);
    return std::move(stream).Release();
}

void Chunk::Write(ByteOutputStream& stream) const
{
    stream.WriteNative(Length());
    stream.Write(m_type.AsBytes());
    stream.Write(Data());
    stream.WriteNative(m_crc);
}

std::string Chunk::Describe() const
{
    std::ostringstream description;
    description << "Chunk Type: " << m_type.ToString() << "\nData: ";

    if(auto text = DataAsString(); text)
    {
        description << std::move(text).value();
    }
    else
    {
        description << '[';
        for(std::size_t i = 0; i < m_data.size(); i++)
        {
            if(i != 0)
                description << ", ";
            description << static_cast<unsigned int>(m_data[i]);
        }
        description << ']';
    }

    return description.str();
}
