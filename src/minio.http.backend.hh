#pragma once

#include "http.hh"

namespace chunkstore {
/**
 * @brief HttpBackend over the minio-cpp HTTP layer (libcurl).
 *
 * Requests that fail to connect are retried up to @p max_retries times,
 * provided no part of the response body has been handed to the caller.
 * Timeouts are never retried.
 */
class MinioHttpBackend final : public HttpBackend
{
  public:
    explicit MinioHttpBackend(unsigned int max_retries = 2);

    HttpResponse execute(const HttpRequest& request) override;

  private:
    unsigned int max_retries_;

    HttpResponse execute_once_(const HttpRequest& request,
                               std::string_view body,
                               bool& body_delivered);
};
} // namespace chunkstore
