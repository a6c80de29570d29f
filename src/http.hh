#pragma once

#include "chunkstore.hh"
#include "crypto.hh"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace chunkstore {
enum class HttpMethod
{
    Get,
    Head,
    Put,
    Post,
    Delete,
};

std::string_view
to_string(HttpMethod method);

struct HttpUrl
{
    bool https{ false };
    std::string host;
    unsigned int port{ 0 }; ///< 0 for the scheme's default
    std::string path;       ///< percent-encoded, starting with '/'
    std::string query;      ///< percent-encoded, without the leading '?'

    /**
     * @brief Parse an absolute http or https URL.
     * @throw std::invalid_argument if @p url is not of that form.
     */
    static HttpUrl parse(std::string_view url);

    std::string str() const;

    /// Number of non-empty components of the path.
    size_t path_segments() const;
};

/// Percent-encode @p path, keeping '/' separators.
std::string
encode_path(std::string_view path);

/// Percent-encode @p value for use in a query string.
std::string
encode_query_value(std::string_view value);

std::string
percent_decode(std::string_view value);

struct CaseInsensitiveLess
{
    bool operator()(const std::string& a, const std::string& b) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

/// Receives the body of a successful response as it arrives.
using BodySink = std::function<bool(std::span<const std::byte>)>;

struct HttpRequest
{
    HttpRequest(HttpMethod method, HttpUrl url)
      : method{ method }
      , url{ std::move(url) }
    {
    }

    HttpMethod method;
    HttpUrl url;
    HttpHeaders headers;
    ByteSegments body; ///< sent back to back
    std::optional<std::chrono::milliseconds> timeout;

    /// If set, takes the body of a 2xx response instead of HttpResponse::body.
    /// Returning false aborts the transfer.
    BodySink on_body;

    size_t body_size() const;
    std::optional<std::string> header(const std::string& name) const;
};

struct HttpResponse
{
    int status_code{ 0 };
    std::string body;

    std::string error; ///< set if no complete response was received
    bool timed_out{ false };

    bool ok() const noexcept { return status_code >= 200 && status_code < 300; }
};

std::string_view
reason_phrase(int status_code);

/**
 * @brief Executes single HTTP exchanges. Connection-level failures are
 * reported in HttpResponse::error rather than thrown.
 */
class HttpBackend
{
  public:
    virtual ~HttpBackend() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

using HttpBackendFactory = std::function<std::unique_ptr<HttpBackend>()>;
} // namespace chunkstore
