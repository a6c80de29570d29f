#pragma once

#include "http.hh"

#include <initializer_list>
#include <string>

namespace chunkstore {
/// The Code and Message of an S3 <Error> response body, if present.
struct S3ErrorInfo
{
    std::string code;
    std::string message;
};

S3ErrorInfo
parse_s3_error(std::string_view body);

/**
 * @brief Map an unsuccessful response to the corresponding ChunkStoreError.
 *
 * - 401 raises AuthorisationFailed.
 * - 403 and 404 raise ChunkNotFound if the request addressed an object
 *   (more than one path segment) and StoreUnavailable otherwise.
 * - Any other non-2xx status raises StoreUnavailable.
 *
 * @param ignored_statuses Statuses that are not treated as failures.
 * @param base_segments Path segments of the endpoint itself, which are not
 * counted.
 */
void
raise_for_status(const HttpRequest& request,
                 const HttpResponse& response,
                 std::initializer_list<int> ignored_statuses = {},
                 size_t base_segments = 0);
} // namespace chunkstore
