#include "xlstext/core/FileSignature.hpp"
#include "xlstext/utils/FileWrapper.hpp"
#include "xlstext/utils/ModuleLoggers.hpp"

#include <algorithm>

namespace xlstext {
namespace core {

bool isFileXLS(const unsigned char* data, size_t size) noexcept {
    if (!data || size < kXlsSignature.size()) {
        return false;
    }
    return std::equal(kXlsSignature.begin(), kXlsSignature.end(), data);
}

Result<bool> isFileXLSPath(const std::string& path) {
    auto file = utils::FileWrapper::open(path, "rb");
    if (!file) {
        return file.error();
    }

    std::array<unsigned char, kXlsSignature.size()> header{};
    const size_t n = std::fread(header.data(), 1, header.size(), file.value().get());
    if (n < header.size() && std::ferror(file.value().get())) {
        return makeError(ErrorCode::FileReadError, "Failed to read file header", path);
    }

    const bool result = isFileXLS(header.data(), n);
    CORE_DEBUG("Signature check {}: {}", path, result);
    return result;
}

}} // namespace xlstext::core
