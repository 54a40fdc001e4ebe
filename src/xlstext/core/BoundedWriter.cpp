#include "xlstext/core/BoundedWriter.hpp"
#include "xlstext/utils/ModuleLoggers.hpp"

namespace xlstext {
namespace core {

Error BoundedWriter::write(std::string_view chunk) {
    // 非正预算按0处理
    const uint64_t allowed = remaining_ > 0 ? static_cast<uint64_t>(remaining_) : 0;
    if (static_cast<uint64_t>(chunk.size()) > allowed) {
        chunk = chunk.substr(0, static_cast<size_t>(allowed));
    }

    remaining_ -= static_cast<int64_t>(chunk.size());

    size_t n = 0;
    Error err = sink_.write(chunk.data(), chunk.size(), n);
    written_ += static_cast<int64_t>(n);

    if (err) {
        failed_ = true;
        CORE_WARN("Write to {} failed after {} bytes: {}", sink_.getTypeName(), written_, err.fullMessage());
    } else if (remaining_ == 0) {
        CORE_DEBUG("Byte budget exhausted after {} bytes", written_);
    }
    return err;
}

}} // namespace xlstext::core
