#pragma once
#include <filesystem>
#include <span>
#include <vector>
#include "PlatformDetection.h"

AnyError<std::vector<Byte>> ReadFile(const std::filesystem::path& path);

//Replaces the file's contents
AnyError<void> WriteFile(const std::filesystem::path& path, std::span<const Byte> bytes);
