#include "FileIO.h"
#include <fstream>

AnyError<std::vector<Byte>> ReadFile(const std::filesystem::path& path)
{
    std::ifstream file{ path, std::ios::binary | std::ios::in };
    if(!file.is_open())
        return tl::unexpected(PNGError::File_Read_Failure);

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    if(size < 0)
        return tl::unexpected(PNGError::File_Read_Failure);
    file.seekg(0);

    std::vector<Byte> bytes(static_cast<std::size_t>(size));
    if(!file.read(reinterpret_cast<char*>(bytes.data()), size))
        return tl::unexpected(PNGError::File_Read_Failure);

    return bytes;
}

AnyError<void> WriteFile(const std::filesystem::path& path, std::span<const Byte> bytes)
{
    std::ofstream file{ path, std::ios::binary | std::ios::out | std::ios::trunc };
    if(!file.is_open())
        return tl::unexpected(PNGError::File_Write_Failure);

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if(!file)
        return tl::unexpected(PNGError::File_Write_Failure);

    return {};
}
