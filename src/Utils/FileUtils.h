#pragma once

#include <string>
#include <filesystem>
#include "Result.h"

namespace Helios::Utils {

// Read text file
Result<std::string> ReadTextFile(const std::filesystem::path& path);

bool FileExists(const std::filesystem::path& path);

} // namespace Helios::Utils
