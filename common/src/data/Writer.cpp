#include "data/Writer.h"

#include <cassert>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace corpuscount::data {

FileWriter::FileWriter(const char* filename) : file_(fopen(filename, "wb")), name_(filename), owned_(true) {
    if (file_ == nullptr) {
        throw std::runtime_error("failed to open " + name_ + " for writing: " + std::strerror(errno));
    }
}

FileWriter::FileWriter(FILE* f, std::string name, bool takeOwnership)
    : file_(f), name_(std::move(name)), owned_(takeOwnership) {
    if (!file_) {
        throw std::runtime_error("invalid file handle for " + name_);
    }
}

FileWriter::~FileWriter() {
    // Errors on this path were already surfaced by Close()
    if (owned_ && file_) {
        fclose(file_);
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : file_(other.file_), name_(std::move(other.name_)), owned_(other.owned_) {
    other.file_ = nullptr;
    other.owned_ = false;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (owned_ && file_) {
            fclose(file_);
        }
        file_ = other.file_;
        name_ = std::move(other.name_);
        owned_ = other.owned_;
        other.file_ = nullptr;
        other.owned_ = false;
    }
    return *this;
}

void FileWriter::Write(const void* data, size_t size) {
    if (size == 0) {
        return;
    }
    assert(file_ != nullptr);
    if (fwrite(data, 1, size, file_) != size) {
        auto err = ferror(file_);
        if (err) {
            throw std::runtime_error("failed to write to " + name_ + ": " + std::strerror(errno));
        } else {
            throw std::runtime_error("failed to write to " + name_ + ": unexpected write size");
        }
    }
}

void FileWriter::Close() {
    if (!file_) {
        return;
    }
    FILE* f = file_;
    file_ = nullptr;
    if (owned_) {
        if (fclose(f) != 0) {
            throw std::runtime_error("failed to close " + name_ + ": " + std::strerror(errno));
        }
    } else if (fflush(f) != 0) {
        throw std::runtime_error("failed to flush " + name_ + ": " + std::strerror(errno));
    }
}

void BufferWriter::Write(const void* data, size_t size) {
    if (size == 0) {
        return;
    }
    const auto* charPtr = static_cast<const char*>(data);
    buffer_.insert(buffer_.end(), charPtr, charPtr + size);
}

std::vector<char> BufferWriter::Release() {
    std::vector<char> temp;
    std::swap(buffer_, temp);
    return temp;
}

}  // namespace corpuscount::data
