#include "ChunkType.h"
#include <utility>

namespace
{
    struct StandardChunk
    {
        ChunkType identifier;
        std::string_view name;
    };

    constexpr auto standardChunks = std::to_array<StandardChunk>({
        { ChunkIdentifiers::header, "Image Header" },
        { ChunkIdentifiers::palette, "Palette" },
        { ChunkIdentifiers::imageData, "Image Data" },
        { ChunkIdentifiers::imageTrailer, "Image Trailer" },
        { ChunkIdentifiers::chromaticities, "Primary Chromaticities" },
        { ChunkIdentifiers::imageGamma, "Image Gamma" },
        { ChunkIdentifiers::iccProfile, "Embedded ICC Profile" },
        { ChunkIdentifiers::significantBits, "Significant Bits" },
        { ChunkIdentifiers::rgbColorSpace, "Standard RGB Color Space" },
        { ChunkIdentifiers::backgroundColor, "Background Color" },
        { ChunkIdentifiers::imageHistogram, "Image Histogram" },
        { ChunkIdentifiers::transparency, "Transparency" },
        { ChunkIdentifiers::physicalPixelDimensions, "Physical Pixel Dimensions" },
        { ChunkIdentifiers::suggestedPalette, "Suggested Palette" },
        { ChunkIdentifiers::lastModificationTime, "Image Last-Modification Time" },
        { ChunkIdentifiers::internationalTextualData, "International Textual Data" },
        { ChunkIdentifiers::texturalData, "Textual Data" },
        { ChunkIdentifiers::compressedTextualData, "Compressed Textual Data" } });
}

AnyError<ChunkType> ChunkType::FromString(std::string_view string)
{
    if(string.size() != 4)
        return tl::unexpected(PNGError::Invalid_Chunk_Type);

    Bytes<4> bytes;
    std::transform(string.begin(), string.end(), bytes.begin(), [](char c) { return static_cast<Byte>(c); });

    ChunkType type = FromBytes(bytes);
    if(!type.IsAlphabetic())
        return tl::unexpected(PNGError::Invalid_Chunk_Type);

    return type;
}

std::string_view StandardChunkName(const ChunkType& type) noexcept
{
    auto it = std::find_if(standardChunks.begin(), standardChunks.end(), [&type](const StandardChunk& chunk) { return chunk.identifier == type; });
    if(it == standardChunks.end())
        return {};

    return it->name;
}
