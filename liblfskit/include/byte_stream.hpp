//
// Created by Giuseppe Francione on 14/01/26.
//

/**
 * @file byte_stream.hpp
 * @brief Minimal reader/writer abstractions used by the copy helpers.
 */

#ifndef LFSKIT_BYTE_STREAM_HPP
#define LFSKIT_BYTE_STREAM_HPP

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <iosfwd>
#include <span>

namespace lfskit {

/**
 * @brief A readable byte source.
 *
 * read() fills at most out.size() bytes and returns how many were produced.
 * A return value of 0 for a non-empty buffer means end of data.
 * Failures are reported by throwing.
 */
class ByteReader {
public:
    virtual ~ByteReader() = default;

    virtual std::size_t read(std::span<std::byte> out) = 0;
};

/**
 * @brief A writable byte sink. write() consumes the whole buffer or throws.
 */
class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    virtual void write(std::span<const std::byte> data) = 0;
};

/**
 * @brief Reader over a borrowed std::istream.
 */
class StreamReader final : public ByteReader {
public:
    explicit StreamReader(std::istream& in) : in_(in) {}

    std::size_t read(std::span<std::byte> out) override;

private:
    std::istream& in_;
};

/**
 * @brief Writer over a borrowed std::ostream.
 */
class StreamWriter final : public ByteWriter {
public:
    explicit StreamWriter(std::ostream& out) : out_(out) {}

    void write(std::span<const std::byte> data) override;

private:
    std::ostream& out_;
};

/**
 * @brief Reader owning a FILE* opened in binary mode.
 */
class FileReader final : public ByteReader {
public:
    explicit FileReader(const std::filesystem::path& path);
    ~FileReader() override;

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    std::size_t read(std::span<std::byte> out) override;

private:
    std::filesystem::path path_;
    FILE* fp_ = nullptr;
};

/**
 * @brief Writer owning a FILE* opened for truncating binary writes.
 */
class FileWriter final : public ByteWriter {
public:
    explicit FileWriter(const std::filesystem::path& path);
    ~FileWriter() override;

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    void write(std::span<const std::byte> data) override;

    /**
     * @brief Flush and close the file, reporting errors the destructor would hide.
     */
    void close();

private:
    std::filesystem::path path_;
    FILE* fp_ = nullptr;
};

} // namespace lfskit

#endif // LFSKIT_BYTE_STREAM_HPP
