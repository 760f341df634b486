#include "UTF8.h"

namespace UTF8
{
    namespace
    {
        constexpr bool IsContinuation(Byte b) noexcept
        {
            return (b & 0xC0) == 0x80;
        }

        struct SequenceInfo
        {
            std::size_t byteCount;
            std::uint32_t leadBits;
            std::uint32_t minimumCodepoint;
        };

        constexpr std::optional<SequenceInfo> ClassifyLeadByte(Byte lead) noexcept
        {
            if(lead < 0x80)
                return SequenceInfo{ 1, lead, 0 };
            if((lead & 0xE0) == 0xC0)
                return SequenceInfo{ 2, static_cast<std::uint32_t>(lead & 0x1F), 0x80 };
            if((lead & 0xF0) == 0xE0)
                return SequenceInfo{ 3, static_cast<std::uint32_t>(lead & 0x0F), 0x800 };
            if((lead & 0xF8) == 0xF0)
                return SequenceInfo{ 4, static_cast<std::uint32_t>(lead & 0x07), 0x10000 };

            return std::nullopt;
        }
    }

    std::optional<DecodedCodepoint> DecodeCodepoint(std::span<const Byte> bytes) noexcept
    {
        if(bytes.empty())
            return std::nullopt;

        std::optional<SequenceInfo> info = ClassifyLeadByte(bytes[0]);
        if(!info || bytes.size() < info->byteCount)
            return std::nullopt;

        std::uint32_t codepoint = info->leadBits;
        for(std::size_t i = 1; i < info->byteCount; i++)
        {
            if(!IsContinuation(bytes[i]))
                return std::nullopt;

            codepoint = (codepoint << 6) | (bytes[i] & 0x3F);
        }

        if(codepoint < info->minimumCodepoint)
            return std::nullopt;
        if(codepoint > 0x10FFFF)
            return std::nullopt;
        if(codepoint >= 0xD800 && codepoint <= 0xDFFF)
            return std::nullopt;

        return DecodedCodepoint{ codepoint, info->byteCount };
    }

    bool IsValid(std::span<const Byte> bytes) noexcept
    {
        while(!bytes.empty())
        {
            std::optional<DecodedCodepoint> decoded = DecodeCodepoint(bytes);
            if(!decoded)
                return false;

            bytes = bytes.subspan(decoded->byteCount);
        }
        return true;
    }

    AnyError<std::string> ToString(std::span<const Byte> bytes)
    {
        if(!IsValid(bytes))
            return tl::unexpected(PNGError::Invalid_Utf8);

        return std::string(bytes.begin(), bytes.end());
    }
}
