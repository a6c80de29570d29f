#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chunkstore {
/// One page of a ListObjects (v1) response.
struct ListBucketPage
{
    std::vector<std::string> keys;
    bool is_truncated{ false };
    std::string next_marker; ///< empty if the response carries none
};

/**
 * @brief Parse a ListBucketResult document.
 * @throw TransportError (MalformedResponse) if @p xml is not one.
 */
ListBucketPage
parse_list_bucket_result(std::string_view xml);
} // namespace chunkstore
