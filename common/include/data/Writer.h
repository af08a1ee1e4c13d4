#ifndef COMMON_DATA_WRITER_H
#define COMMON_DATA_WRITER_H

#include <concepts>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace corpuscount::data {

template<typename T>
concept Writer = requires(T writer, const void* data, size_t size) {
    { writer.Write(data, size) } -> std::same_as<void>;
};

/**
 * @brief Buffered writer over a stdio stream. Either owns a file it opened by
 * path, or borrows a stream such as stdout. Errors are reported as
 * std::runtime_error naming the destination.
 */
class FileWriter {
public:
    explicit FileWriter(const char* filename);
    FileWriter(FILE* f, std::string name, bool takeOwnership = false);
    ~FileWriter();

    // Disable copying
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    // Allow moving
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    void Write(const void* data, size_t size);
    void Write(std::string_view s) { Write(s.data(), s.size()); }

    void Close();

    const std::string& Name() const { return name_; }

private:
    FILE* file_;
    std::string name_;
    bool owned_;
};

class BufferWriter {
public:
    void Write(const void* data, size_t size);
    void Write(std::string_view s) { Write(s.data(), s.size()); }

    std::string_view View() const { return {buffer_.data(), buffer_.size()}; }
    std::vector<char> Release();

private:
    std::vector<char> buffer_;
};

}  // namespace corpuscount::data

#endif
