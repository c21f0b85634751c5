//
// Created by Giuseppe Francione on 20/01/26.
//

#ifndef LFSKIT_TEST_UTILS_HPP
#define LFSKIT_TEST_UTILS_HPP

#include "../liblfskit/include/byte_stream.hpp"
#include "../liblfskit/include/log_sink.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lfskit::test {

// Scoped unique directory under the system temp path.
class TempDir {
public:
    TempDir() {
        std::mt19937_64 rng{std::random_device{}()};
        path_ = std::filesystem::temp_directory_path() / ("lfskit-test-" + std::to_string(rng()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string read_text(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void write_text(const std::filesystem::path& p, const std::string& text) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << text;
}

// Serves data in the given chunk sizes, one per read(); optionally fails
// on a given (1-based) read.
class ChunkedReader final : public ByteReader {
public:
    ChunkedReader(std::string data, std::vector<std::size_t> chunks, int fail_on_read = 0)
        : data_(std::move(data)), chunks_(std::move(chunks)), fail_on_read_(fail_on_read) {}

    std::size_t read(std::span<std::byte> out) override {
        ++reads_;
        if (reads_ == fail_on_read_) {
            throw std::runtime_error("ChunkedReader: injected failure");
        }
        if (next_chunk_ >= chunks_.size() || out.empty()) {
            return 0;
        }
        const std::size_t n = std::min({chunks_[next_chunk_++], out.size(), data_.size() - offset_});
        std::memcpy(out.data(), data_.data() + offset_, n);
        offset_ += n;
        return n;
    }

    [[nodiscard]] int reads() const { return reads_; }

private:
    std::string data_;
    std::vector<std::size_t> chunks_;
    std::size_t next_chunk_ = 0;
    std::size_t offset_ = 0;
    int fail_on_read_ = 0;
    int reads_ = 0;
};

class StringWriter final : public ByteWriter {
public:
    void write(std::span<const std::byte> data) override {
        text.append(reinterpret_cast<const char*>(data.data()), data.size());
    }

    std::string text;
};

// Collects log records for assertions.
class CapturingLogSink final : public ILogSink {
public:
    struct Record {
        LogLevel level;
        std::string message;
        std::string tag;
    };

    explicit CapturingLogSink(std::vector<Record>& records) : records_(records) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        std::lock_guard lock(mtx_);
        records_.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::vector<Record>& records_;
    std::mutex mtx_;
};

} // namespace lfskit::test

#endif // LFSKIT_TEST_UTILS_HPP
