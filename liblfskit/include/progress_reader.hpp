//
// Created by Giuseppe Francione on 14/01/26.
//

/**
 * @file progress_reader.hpp
 * @brief Byte copy with per-read progress notification.
 */

#ifndef LFSKIT_PROGRESS_READER_HPP
#define LFSKIT_PROGRESS_READER_HPP

#include "byte_stream.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace lfskit {

/**
 * @brief Progress notification invoked after every successful read.
 *
 * Arguments are the declared total size, the cumulative number of bytes read
 * so far and the number of bytes produced by the read that triggered the call.
 * A callback signals failure by throwing; the exception aborts the copy.
 */
using CopyCallback = std::function<void(std::int64_t total_size,
                                        std::int64_t read_so_far,
                                        std::size_t read_since_last)>;

/**
 * @brief Reader decorator that counts bytes and reports them to a CopyCallback.
 *
 * @details Owns the wrapped reader. The declared total is informational only:
 * it is never compared with the bytes actually read, so read_size() may end
 * up larger than total_size() when the caller passed an estimate.
 *
 * Not thread-safe; one instance belongs to one copy.
 */
class ProgressReader final : public ByteReader {
public:
    ProgressReader(std::unique_ptr<ByteReader> inner,
                   std::int64_t total_size,
                   CopyCallback callback);

    /**
     * @brief Reads from the wrapped reader, updates the counter, then notifies.
     *
     * The counter already includes this read when the callback runs, and
     * stays updated if the callback throws. End of data (0 bytes for a
     * non-empty buffer) is not reported to the callback.
     */
    std::size_t read(std::span<std::byte> out) override;

    [[nodiscard]] std::int64_t total_size() const { return total_size_; }
    [[nodiscard]] std::int64_t read_size() const { return read_size_; }

private:
    std::unique_ptr<ByteReader> inner_;
    CopyCallback callback_;
    std::int64_t total_size_ = 0;
    std::int64_t read_size_ = 0;
};

/**
 * @brief Copies reader into writer until end of data.
 * @return Number of bytes written.
 */
std::int64_t copy(ByteWriter& writer, ByteReader& reader);

/**
 * @brief Copies reader into writer, reporting progress through callback.
 *
 * With an empty callback this is a plain copy() and no ProgressReader is
 * created. Any exception from the reader, the writer or the callback
 * propagates and leaves the destination partially written.
 *
 * @return Number of bytes written.
 */
std::int64_t copy_with_callback(ByteWriter& writer,
                                std::unique_ptr<ByteReader> reader,
                                std::int64_t total_size,
                                const CopyCallback& callback);

/**
 * @brief Combines two optional callbacks; first runs before second.
 *
 * Returns an empty callback when both are empty, and the non-empty one
 * unchanged when only one is set.
 */
CopyCallback chain_callbacks(CopyCallback first, CopyCallback second);

} // namespace lfskit

#endif // LFSKIT_PROGRESS_READER_HPP
