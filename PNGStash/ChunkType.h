#pragma once
#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include "PlatformDetection.h"

constexpr bool IsUppercase(Byte b) noexcept
{
    return b >= 'A' && b <= 'Z';
}

constexpr bool IsLowercase(Byte b) noexcept
{
    return b >= 'a' && b <= 'z';
}

constexpr bool IsAlphabetic(Byte b) noexcept
{
    return IsUppercase(b) || IsLowercase(b);
}

/// <summary>
/// 4 byte chunk type code.
/// Bit 5 of every byte carries a property: ancillary, private, reserved and safe to copy,
/// which for letters is the same as the letter being lowercase.
/// </summary>
class ChunkType
{
    Bytes<4> m_bytes{};

    static constexpr Byte propertyBit = 0x20;

public:
    constexpr ChunkType() = default;

public:
    //Never fails, the bytes are stored as is and may not form a valid type
    static constexpr ChunkType FromBytes(Bytes<4> bytes) noexcept
    {
        ChunkType type;
        type.m_bytes = bytes;
        return type;
    }

    static AnyError<ChunkType> FromString(std::string_view string);

public:
    constexpr bool IsCritical() const noexcept { return !HasPropertyBit(0); }
    constexpr bool IsPublic() const noexcept { return !HasPropertyBit(1); }
    constexpr bool IsReservedBitValid() const noexcept { return !HasPropertyBit(2); }
    constexpr bool IsSafeToCopy() const noexcept { return HasPropertyBit(3); }

    constexpr bool IsAlphabetic() const noexcept { return std::all_of(m_bytes.begin(), m_bytes.end(), ::IsAlphabetic); }
    constexpr bool IsValid() const noexcept { return IsAlphabetic() && IsReservedBitValid(); }

    constexpr const Bytes<4>& AsBytes() const noexcept { return m_bytes; }
    std::string ToString() const { return std::string(m_bytes.begin(), m_bytes.end()); }

    constexpr bool operator==(const ChunkType& rh) const noexcept = default;

private:
    constexpr bool HasPropertyBit(std::size_t index) const noexcept { return (m_bytes[index] & propertyBit) != 0; }
};

consteval ChunkType operator""_ct(const char* string, std::size_t n)
{
    if(n != 4)
        throw std::invalid_argument("Expected string size to be 4");

    Bytes<4> bytes{};
    std::copy_n(string, 4, bytes.begin());
    return ChunkType::FromBytes(bytes);
}

namespace ChunkIdentifiers
{
    constexpr ChunkType header = "IHDR"_ct;
    constexpr ChunkType palette = "PLTE"_ct;
    constexpr ChunkType imageData = "IDAT"_ct;
    constexpr ChunkType imageTrailer = "IEND"_ct;
    constexpr ChunkType chromaticities = "cHRM"_ct;
    constexpr ChunkType imageGamma = "gAMA"_ct;
    constexpr ChunkType iccProfile = "iCCP"_ct;
    constexpr ChunkType significantBits = "sBIT"_ct;
    constexpr ChunkType rgbColorSpace = "sRGB"_ct;
    constexpr ChunkType backgroundColor = "bKGD"_ct;
    constexpr ChunkType imageHistogram = "hIST"_ct;
    constexpr ChunkType transparency = "tRNS"_ct;
    constexpr ChunkType physicalPixelDimensions = "pHYs"_ct;
    constexpr ChunkType suggestedPalette = "sPLT"_ct;
    constexpr ChunkType lastModificationTime = "tIME"_ct;
    constexpr ChunkType internationalTextualData = "iTXt"_ct;
    constexpr ChunkType texturalData = "tEXt"_ct;
    constexpr ChunkType compressedTextualData = "zTXt"_ct;
}

/// <summary>
/// Name the PNG specification gives to a standard chunk type
/// </summary>
/// <returns>Empty view for private and unregistered types</returns>
std::string_view StandardChunkName(const ChunkType& type) noexcept;
