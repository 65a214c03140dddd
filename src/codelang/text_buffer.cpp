#include <codelang/text_buffer.hpp>

#include <fstream>
#include <sstream>

namespace codelang {

Result<std::string> FileBuffer::contents() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return Error(ErrorCode::NOT_FOUND, "File not found: " + path_.string());
    }
    if (std::filesystem::is_directory(path_, ec)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Is a directory: " + path_.string());
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open file: " + path_.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::IO_ERROR, "Failed to read file: " + path_.string());
    }
    return ss.str();
}

Result<std::string> StreamBuffer::contents() const {
    if (!drained_) {
        std::ostringstream ss;
        ss << in_.rdbuf();
        if (in_.bad()) {
            return Error(ErrorCode::IO_ERROR, "Failed to read " + name_);
        }
        text_ = ss.str();
        drained_ = true;
    }
    return text_;
}

}  // namespace codelang
