#pragma once

#include "chunkstore.hh"
#include "crypto.hh"

#include <optional>
#include <string>

namespace chunkstore {
struct NpyHeader
{
    DataType dtype;
    bool fortran_order{ false };
    Shape shape;
};

/**
 * @brief A chunk framed for transmission: the NPY header, followed by the
 * chunk's own bytes, which are referenced rather than copied.
 */
struct EncodedChunk
{
    std::string header;
    std::span<const std::byte> data;
    std::string md5; ///< base64 MD5 of header + data, for Content-MD5

    ByteSegments segments() const;
    size_t nbytes() const noexcept { return header.size() + data.size(); }
};

/// Python tuple notation, e.g. "()", "(3,)" or "(8, 6, 2)".
std::string
format_shape(const Shape& shape);

/**
 * @brief Serialize an NPY header, padded so that the data that follows it
 * starts on a 64-byte boundary.
 * @note Picks format version 2.0 if the header does not fit version 1.0.
 */
std::string
encode_npy_header(const NpyHeader& header);

/**
 * @brief Parse the Python-literal dictionary of an NPY header.
 * @throw BadChunk if the dictionary is malformed, incomplete or describes a
 * dtype that cannot be stored (objects, structured types).
 */
NpyHeader
parse_npy_header_dict(std::string_view dict);

/**
 * @brief Frame @p chunk as an NPY payload.
 * @note The returned object references the bytes of @p chunk.
 */
EncodedChunk
encode_chunk(const ArrayChunk& chunk);

/**
 * @brief Incremental NPY decoder.
 *
 * Feed bytes with consume() as they arrive. The header is buffered until
 * complete; the chunk buffer is then allocated and the remaining bytes are
 * copied straight into it.
 */
class NpyReader
{
  public:
    /**
     * @brief Consume the next part of the payload.
     * @return False if the payload is malformed, after which the reader
     * ignores further input.
     */
    bool consume(std::span<const std::byte> data) noexcept;

    bool failed() const noexcept { return !error_.empty(); }
    const std::string& error() const noexcept { return error_; }

    /**
     * @brief Take the decoded chunk.
     * @throw BadChunk if the payload was malformed, or if fewer or more bytes
     * were received than the header declares.
     */
    ArrayChunk finish();

  private:
    std::string header_buffer_;
    size_t header_size_{ 0 }; ///< prelude + dictionary, 0 until known
    std::optional<ArrayChunk> chunk_;
    size_t nbytes_received_{ 0 };
    std::string error_;

    void consume_(std::span<const std::byte> data);
    void check_version_() const;
    void parse_header_();
};

/// Decode a complete NPY payload.
ArrayChunk
decode_chunk(std::span<const std::byte> payload);
} // namespace chunkstore
