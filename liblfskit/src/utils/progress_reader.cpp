//
// Created by Giuseppe Francione on 14/01/26.
//

#include "../../include/progress_reader.hpp"
#include <array>
#include <stdexcept>

namespace lfskit {

namespace {
constexpr std::size_t kCopyBufferSize = 32 * 1024;
} // namespace

ProgressReader::ProgressReader(std::unique_ptr<ByteReader> inner,
                               const std::int64_t total_size,
                               CopyCallback callback)
    : inner_(std::move(inner)), callback_(std::move(callback)), total_size_(total_size) {
    if (!inner_) {
        throw std::invalid_argument("ProgressReader: null reader");
    }
}

std::size_t ProgressReader::read(const std::span<std::byte> out) {
    const std::size_t n = inner_->read(out);
    read_size_ += static_cast<std::int64_t>(n);

    if (callback_ && (n > 0 || out.empty())) {
        callback_(total_size_, read_size_, n);
    }
    return n;
}

std::int64_t copy(ByteWriter& writer, ByteReader& reader) {
    std::array<std::byte, kCopyBufferSize> buffer{};
    std::int64_t written = 0;

    while (true) {
        const std::size_t n = reader.read(buffer);
        if (n == 0) {
            break;
        }
        writer.write(std::span<const std::byte>(buffer.data(), n));
        written += static_cast<std::int64_t>(n);
    }
    return written;
}

std::int64_t copy_with_callback(ByteWriter& writer,
                                std::unique_ptr<ByteReader> reader,
                                const std::int64_t total_size,
                                const CopyCallback& callback) {
    if (!reader) {
        throw std::invalid_argument("copy_with_callback: null reader");
    }
    if (!callback) {
        return copy(writer, *reader);
    }

    ProgressReader progress(std::move(reader), total_size, callback);
    return copy(writer, progress);
}

CopyCallback chain_callbacks(CopyCallback first, CopyCallback second) {
    if (!first) {
        return second;
    }
    if (!second) {
        return first;
    }
    return [first = std::move(first), second = std::move(second)](const std::int64_t total,
                                                                  const std::int64_t so_far,
                                                                  const std::size_t delta) {
        first(total, so_far, delta);
        second(total, so_far, delta);
    };
}

} // namespace lfskit
