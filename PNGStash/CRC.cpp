#include "CRC.h"
#include <zlib.h>

std::uint32_t ChunkCRC(const Bytes<4>& type, std::span<const Byte> data) noexcept
{
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, type.data(), static_cast<uInt>(type.size()));

    //A null buffer makes zlib hand back the initial value instead of the running crc
    if(!data.empty())
        crc = crc32_z(crc, data.data(), data.size());

    return static_cast<std::uint32_t>(crc);
}
