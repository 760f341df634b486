#pragma once
#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>
#include <string_view>
#include <utility>
#include <tl/expected.hpp>

inline constexpr bool IsPlatformNetworkByteOrder = std::endian::native == std::endian::big;
inline constexpr bool SwapByteOrder = !IsPlatformNetworkByteOrder;

using Byte = std::uint8_t;

template<std::size_t Count>
using Bytes = std::array<Byte, Count>;

enum class PNGError : int
{
    Unknown_Signature,
    Insufficient_Size,
    Invalid_Chunk_Type,
    Reserved_Bit_Invalid,
    Data_Too_Large,
    Crc_Mismatch,
    Invalid_Utf8,
    Chunk_Not_Found,
    File_Read_Failure,
    File_Write_Failure
};

enum class ErrorKind
{
    Format,
    Crc_Mismatch,
    Encoding,
    Not_Found,
    IO
};

constexpr ErrorKind KindOf(PNGError error) noexcept
{
    switch(error)
    {
    case PNGError::Unknown_Signature:
    case PNGError::Insufficient_Size:
    case PNGError::Invalid_Chunk_Type:
    case PNGError::Reserved_Bit_Invalid:
    case PNGError::Data_Too_Large:
        return ErrorKind::Format;
    case PNGError::Crc_Mismatch:
        return ErrorKind::Crc_Mismatch;
    case PNGError::Invalid_Utf8:
        return ErrorKind::Encoding;
    case PNGError::Chunk_Not_Found:
        return ErrorKind::Not_Found;
    case PNGError::File_Read_Failure:
    case PNGError::File_Write_Failure:
        return ErrorKind::IO;
    }

    return ErrorKind::Format;
}

constexpr std::string_view ToString(PNGError error) noexcept
{
    switch(error)
    {
    case PNGError::Unknown_Signature:
        return "PNG signature could not be matched";
    case PNGError::Insufficient_Size:
        return "Not enough bytes left to read a complete chunk";
    case PNGError::Invalid_Chunk_Type:
        return "Chunk type must be exactly 4 ASCII letters";
    case PNGError::Reserved_Bit_Invalid:
        return "Chunk type has the reserved bit set (third letter must be uppercase)";
    case PNGError::Data_Too_Large:
        return "Chunk data does not fit in a 32 bit length field";
    case PNGError::Crc_Mismatch:
        return "Stored CRC does not match the chunk type and data";
    case PNGError::Invalid_Utf8:
        return "Chunk data is not valid UTF-8";
    case PNGError::Chunk_Not_Found:
        return "No chunk of the requested type was found";
    case PNGError::File_Read_Failure:
        return "File could not be read";
    case PNGError::File_Write_Failure:
        return "File could not be written";
    }

    return "Unknown error";
}

template<class Ty>
using AnyError = tl::expected<Ty, PNGError>;

template<std::size_t Count>
constexpr Bytes<Count> FlipEndianness(Bytes<Count> bytes)
{
    Bytes<Count> newBytes;
    std::reverse_copy(bytes.begin(), bytes.end(), newBytes.begin());
    return newBytes;
}

//PNG stores every integer in network byte order, converting is the same operation both ways
template<std::size_t Count>
constexpr Bytes<Count> ToNativeRepresentation(Bytes<Count> bytes)
{
    if constexpr(SwapByteOrder)
        return FlipEndianness(std::move(bytes));
    else
        return bytes;
}

template<std::size_t Count>
constexpr Bytes<Count> ToNetworkRepresentation(Bytes<Count> bytes)
{
    return ToNativeRepresentation(std::move(bytes));
}

inline constexpr Bytes<8> PNGSignature = Bytes<8>{ 137, 80, 78, 71, 13, 10, 26, 10 };
