#pragma once

#include <string>
#include <string_view>

namespace chunkstore {
/// Bucket policy granting anonymous users read and list access.
std::string
public_read_policy(std::string_view bucket);

/// Lifecycle configuration expiring every object after @p days.
std::string
expiry_lifecycle(unsigned int days);
} // namespace chunkstore
