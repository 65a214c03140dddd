#pragma once

#include <codelang/result.hpp>

#include <filesystem>
#include <istream>
#include <string>

namespace codelang {

/**
 * Source of text to classify. Integrations wrap their own buffer
 * type (editor buffer, file, socket payload) behind this interface.
 */
class TextBuffer {
public:
    virtual ~TextBuffer() = default;

    // Full contents of the buffer
    virtual Result<std::string> contents() const = 0;

    // Display name for messages ("<stdin>", a path, ...)
    virtual std::string name() const = 0;
};

class StringBuffer : public TextBuffer {
public:
    explicit StringBuffer(std::string text, std::string name = "<string>")
        : text_(std::move(text)), name_(std::move(name)) {}

    Result<std::string> contents() const override { return text_; }
    std::string name() const override { return name_; }

private:
    std::string text_;
    std::string name_;
};

// Reads the file on every contents() call
class FileBuffer : public TextBuffer {
public:
    explicit FileBuffer(std::filesystem::path path) : path_(std::move(path)) {}

    Result<std::string> contents() const override;
    std::string name() const override { return path_.string(); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Drains a stream once; later calls return what was read
class StreamBuffer : public TextBuffer {
public:
    explicit StreamBuffer(std::istream& in, std::string name = "<stdin>")
        : in_(in), name_(std::move(name)) {}

    Result<std::string> contents() const override;
    std::string name() const override { return name_; }

private:
    std::istream& in_;
    std::string name_;
    mutable bool drained_ = false;
    mutable std::string text_;
};

}  // namespace codelang
