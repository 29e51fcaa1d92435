#include "usagedb/storage/file_util.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace usagedb {
namespace storage {

namespace fs = std::filesystem;

core::Result<std::string> ReadWholeFile(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return core::Result<std::string>::from_error(core::NotFoundError("File not found: " + path));
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return core::Result<std::string>::from_error(core::IOError("Failed to open " + path));
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return core::Result<std::string>::from_error(core::IOError("Failed to read " + path));
    }
    return data;
}

core::Result<void> WriteWholeFile(const std::string& path, const std::string& data) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return core::Result<void>::from_error(core::IOError("Failed to open " + tmp_path + " for writing"));
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            return core::Result<void>::from_error(core::IOError("Failed to write " + tmp_path));
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        return core::Result<void>::from_error(core::IOError("Failed to replace " + path));
    }
    return core::Result<void>();
}

core::Result<void> RemoveFileIfExists(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return core::Result<void>::from_error(core::IOError("Failed to remove " + path + ": " + ec.message()));
    }
    return core::Result<void>();
}

core::Result<uint64_t> FileSize(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        auto code = ec == std::errc::no_such_file_or_directory ? core::Error::Code::NOT_FOUND
                                                                 : core::Error::Code::IO;
        return core::Result<uint64_t>::error("Failed to stat " + path + ": " + ec.message(), code);
    }
    return static_cast<uint64_t>(size);
}

core::Result<void> EnsureDirectory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return core::Result<void>::from_error(
            core::IOError("Failed to create directory " + path + ": " + ec.message()));
    }
    return core::Result<void>();
}

} // namespace storage
} // namespace usagedb
