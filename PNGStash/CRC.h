#pragma once
#include <cstdint>
#include <span>
#include "PlatformDetection.h"

/// <summary>
/// CRC-32 (ISO 3309 / IEEE 802.3) of a chunk, calculated over the type bytes followed by the data.
/// The length field is not part of the checksum.
/// </summary>
std::uint32_t ChunkCRC(const Bytes<4>& type, std::span<const Byte> data) noexcept;
