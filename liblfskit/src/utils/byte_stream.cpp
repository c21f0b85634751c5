//
// Created by Giuseppe Francione on 14/01/26.
//

#include "../../include/byte_stream.hpp"
#include "../../include/file_utils.hpp"
#include <cerrno>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace lfskit {

std::size_t StreamReader::read(const std::span<std::byte> out) {
    if (out.empty()) {
        return 0;
    }
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    const auto n = static_cast<std::size_t>(in_.gcount());
    if (in_.bad()) {
        throw std::runtime_error("StreamReader: read failed");
    }
    return n;
}

void StreamWriter::write(const std::span<const std::byte> data) {
    out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out_) {
        throw std::runtime_error("StreamWriter: write failed");
    }
}

FileReader::FileReader(const std::filesystem::path& path) : path_(path) {
    fp_ = open_file(path, "rb");
    if (!fp_) {
        throw std::runtime_error("Cannot open " + path.string() + ": " + errno_message(errno));
    }
}

FileReader::~FileReader() {
    if (fp_) {
        std::fclose(fp_);
    }
}

std::size_t FileReader::read(const std::span<std::byte> out) {
    const std::size_t n = std::fread(out.data(), 1, out.size(), fp_);
    if (n < out.size() && std::ferror(fp_)) {
        throw std::runtime_error("Error reading " + path_.string() + ": " + errno_message(errno));
    }
    return n;
}

FileWriter::FileWriter(const std::filesystem::path& path) : path_(path) {
    fp_ = open_file(path, "wb");
    if (!fp_) {
        throw std::runtime_error("Cannot create " + path.string() + ": " + errno_message(errno));
    }
}

FileWriter::~FileWriter() {
    if (fp_) {
        std::fclose(fp_);
    }
}

void FileWriter::write(const std::span<const std::byte> data) {
    if (!fp_) {
        throw std::runtime_error("Write to closed file " + path_.string());
    }
    if (std::fwrite(data.data(), 1, data.size(), fp_) != data.size()) {
        throw std::runtime_error("Error writing " + path_.string() + ": " + errno_message(errno));
    }
}

void FileWriter::close() {
    if (!fp_) {
        return;
    }
    FILE* fp = fp_;
    fp_ = nullptr;
    if (std::fclose(fp) != 0) {
        throw std::runtime_error("Error closing " + path_.string() + ": " + errno_message(errno));
    }
}

} // namespace lfskit
