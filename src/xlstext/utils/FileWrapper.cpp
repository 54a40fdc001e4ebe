#include "FileWrapper.hpp"
#include "xlstext/utils/ModuleLoggers.hpp"
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace xlstext {
namespace utils {

core::Result<FileWrapper> FileWrapper::open(const std::string& filename, const char* mode) {
    FILE* raw_file = std::fopen(filename.c_str(), mode);
    if (raw_file == nullptr) {
        const int err = errno;
        UTILS_DEBUG("fopen('{}', '{}') failed: {}", filename, mode, std::strerror(err));
        const bool for_write = std::strchr(mode, 'w') != nullptr || std::strchr(mode, 'a') != nullptr;
        if (!for_write && err == ENOENT) {
            return core::makeError(core::ErrorCode::FileNotFound,
                                   fmt::format("Failed to open file: {}", filename),
                                   std::strerror(err));
        }
        return core::makeError(for_write ? core::ErrorCode::FileWriteError : core::ErrorCode::FileReadError,
                               fmt::format("Failed to open file: {}", filename),
                               std::strerror(err));
    }
    return FileWrapper(raw_file, true);
}

FileWrapper::FileWrapper(FILE* file, bool take_ownership) {
    if (take_ownership) {
        file_ = std::unique_ptr<FILE, int(*)(FILE*)>(file, &std::fclose);
    } else {
        file_ = std::unique_ptr<FILE, int(*)(FILE*)>(file, &noClose);
    }
}

size_t FileWrapper::write(const char* data, size_t size) {
    if (!file_ || size == 0) {
        return 0;
    }
    return std::fwrite(data, 1, size, file_.get());
}

bool FileWrapper::flush() {
    return file_ && std::fflush(file_.get()) == 0;
}

} // namespace utils
} // namespace xlstext
