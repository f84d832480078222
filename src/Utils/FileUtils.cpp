#include "FileUtils.h"
#include <fstream>
#include <iterator>

namespace Helios::Utils {

Result<std::string> ReadTextFile(const std::filesystem::path& path) {
    std::ifstream file(path);

    if (!file.is_open()) {
        return Result<std::string>::Err(ErrorCode::Io, "Failed to open file: " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::Err(ErrorCode::Io, "Failed to read file: " + path.string());
    }

    return Result<std::string>::Ok(std::move(content));
}

bool FileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // namespace Helios::Utils
