#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkstore {
using ByteSegments = std::vector<std::span<const std::byte>>;

/**
 * @brief Compute the value of a Content-MD5 header.
 * @param segments The payload, as consecutive byte segments.
 * @return The base64-encoded MD5 digest of the concatenated segments.
 */
std::string
content_md5(const ByteSegments& segments);

std::string
base64_encode(std::string_view data);

/**
 * @brief Decode standard or URL-safe base64, with or without padding.
 * @throw std::invalid_argument if @p data is not valid base64.
 */
std::string
base64_decode(std::string_view data);

/// Raw (binary) HMAC-SHA1 of @p data under @p key.
std::string
hmac_sha1(std::string_view key, std::string_view data);
} // namespace chunkstore
