#pragma once
#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>
#include "PlatformDetection.h"

/// <summary>
/// Bounded reader over an in-memory PNG buffer.
/// Multi-byte integers are read in network byte order and handed back in native order.
/// Reads past the end fail with Insufficient_Size and leave the position untouched.
/// </summary>
class ByteInputStream
{
    std::span<const Byte> m_bytes;
    std::size_t m_bytesRead = 0;

public:
    explicit ByteInputStream(std::span<const Byte> bytes) noexcept :
        m_bytes(bytes)
    {
    }

public:
    template<std::size_t Count>
    AnyError<Bytes<Count>> Read()
    {
        if(UnreadSize() < Count)
            return tl::unexpected(PNGError::Insufficient_Size);

        Bytes<Count> bytes;
        std::copy_n(m_bytes.begin() + m_bytesRead, Count, bytes.begin());
        m_bytesRead += Count;
        return bytes;
    }

    template<class Ty>
        requires std::integral<Ty>
    AnyError<Ty> ReadNative()
    {
        return Read<sizeof(Ty)>().map([](Bytes<sizeof(Ty)> bytes)
            {
                return std::bit_cast<Ty>(ToNativeRepresentation(bytes));
            });
    }

    //The returned view aliases the stream's buffer
    AnyError<std::span<const Byte>> Read(std::size_t count)
    {
        if(UnreadSize() < count)
            return tl::unexpected(PNGError::Insufficient_Size);

        std::span<const Byte> bytes = m_bytes.subspan(m_bytesRead, count);
        m_bytesRead += count;
        return bytes;
    }

    void Seek(std::size_t offset) noexcept { m_bytesRead = std::min(offset, m_bytes.size()); }

    bool HasUnreadData() const noexcept { return m_bytesRead < m_bytes.size(); }
    std::size_t Offset() const noexcept { return m_bytesRead; }
    std::size_t Size() const noexcept { return m_bytes.size(); }
    std::size_t UnreadSize() const noexcept { return m_bytes.size() - m_bytesRead; }
};

class ByteOutputStream
{
    std::vector<Byte> m_bytes;

public:
    ByteOutputStream() = default;
    explicit ByteOutputStream(std::size_t expectedSize)
    {
        m_bytes.reserve(expectedSize);
    }

public:
    template<std::size_t Count>
    void Write(const Bytes<Count>& bytes)
    {
        m_bytes.insert(m_bytes.end(), bytes.begin(), bytes.end());
    }

    void Write(std::span<const Byte> bytes)
    {
        m_bytes.insert(m_bytes.end(), bytes.begin(), bytes.end());
    }

    template<class Ty>
        requires std::integral<Ty>
    void WriteNative(Ty value)
    {
        Write(ToNetworkRepresentation(std::bit_cast<Bytes<sizeof(Ty)>>(value)));
    }

    std::vector<Byte> Release() && noexcept { return std::move(m_bytes); }
};
