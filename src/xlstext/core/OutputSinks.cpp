#include "xlstext/core/OutputSinks.hpp"
#include "xlstext/utils/ModuleLoggers.hpp"
#include <cerrno>
#include <cstring>

namespace xlstext {
namespace core {

Error StringSink::write(const char* data, size_t size, size_t& written) {
    buffer_.append(data, size);
    written = size;
    return success();
}

Error StreamSink::write(const char* data, size_t size, size_t& written) {
    written = 0;
    if (!stream_) {
        return makeError(ErrorCode::FileWriteError, "Output stream is in a failed state");
    }
    stream_.write(data, static_cast<std::streamsize>(size));
    if (!stream_) {
        return makeError(ErrorCode::FileWriteError, "Failed to write to output stream");
    }
    written = size;
    return success();
}

Result<FileSink> FileSink::create(const std::string& path) {
    auto file = utils::FileWrapper::open(path, "wb");
    if (!file) {
        return file.error();
    }
    return FileSink(std::move(file).value());
}

Error FileSink::write(const char* data, size_t size, size_t& written) {
    written = file_.write(data, size);
    if (written != size) {
        const int err = errno;
        CORE_WARN("Short write to file: {} of {} bytes", written, size);
        return makeError(ErrorCode::FileWriteError, "Failed to write to file", std::strerror(err));
    }
    return success();
}

}} // namespace xlstext::core
