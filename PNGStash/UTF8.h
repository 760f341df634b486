#pragma once
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include "PlatformDetection.h"

namespace UTF8
{
    struct DecodedCodepoint
    {
        std::uint32_t codepoint;
        std::size_t byteCount;
    };

    /// <summary>
    /// Decodes the code point at the start of bytes.
    /// Returns nullopt for truncated sequences, stray continuation bytes, overlong forms,
    /// surrogates and values above U+10FFFF.
    /// </summary>
    std::optional<DecodedCodepoint> DecodeCodepoint(std::span<const Byte> bytes) noexcept;

    bool IsValid(std::span<const Byte> bytes) noexcept;

    AnyError<std::string> ToString(std::span<const Byte> bytes);
}
