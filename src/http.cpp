#include "http.hh"
#include "macros.hh"

#include <miniocpp/utils.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

std::string_view
chunkstore::to_string(HttpMethod method)
{
    switch (method) {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Head:
            return "HEAD";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Post:
            return "POST";
        case HttpMethod::Delete:
            return "DELETE";
    }
    return "GET";
}

chunkstore::HttpUrl
chunkstore::HttpUrl::parse(std::string_view url)
{
    HttpUrl out;

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        throw std::invalid_argument("URL lacks a scheme: " + std::string(url));
    }

    const auto scheme = url.substr(0, scheme_end);
    if (scheme == "https") {
        out.https = true;
    } else if (scheme != "http") {
        throw std::invalid_argument("Unsupported URL scheme: " +
                                    std::string(scheme));
    }
    url.remove_prefix(scheme_end + 3);

    auto authority_end = url.find_first_of("/?");
    auto authority = url.substr(0, authority_end);
    url = authority_end == std::string_view::npos
            ? std::string_view{}
            : url.substr(authority_end);

    if (const auto colon = authority.rfind(':');
        colon != std::string_view::npos &&
        authority.find(']', colon) == std::string_view::npos) {
        const auto port = authority.substr(colon + 1);
        auto [end, ec] =
          std::from_chars(port.data(), port.data() + port.size(), out.port);
        if (ec != std::errc{} || end != port.data() + port.size()) {
            throw std::invalid_argument("Invalid port in URL: " +
                                        std::string(port));
        }
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        throw std::invalid_argument("URL lacks a host");
    }
    out.host = authority;

    const auto query_start = url.find('?');
    out.path = url.substr(0, query_start);
    if (query_start != std::string_view::npos) {
        out.query = url.substr(query_start + 1);
    }
    if (out.path.empty()) {
        out.path = "/";
    }

    return out;
}

std::string
chunkstore::HttpUrl::str() const
{
    std::string out = https ? "https://" : "http://";
    out += host;
    if (port) {
        out += ":" + std::to_string(port);
    }
    out += path;
    if (!query.empty()) {
        out += "?" + query;
    }
    return out;
}

size_t
chunkstore::HttpUrl::path_segments() const
{
    size_t count = 0;
    std::string_view rest = path;
    while (!rest.empty()) {
        const auto slash = rest.find('/');
        if (slash != 0) {
            ++count;
        }
        if (slash == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(slash + 1);
    }
    return count;
}

std::string
chunkstore::encode_path(std::string_view path)
{
    return minio::utils::EncodePath(std::string(path));
}

std::string
chunkstore::encode_query_value(std::string_view value)
{
    return minio::utils::UrlEncode(std::string(value));
}

std::string
chunkstore::percent_decode(std::string_view value)
{
    std::string out;
    out.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            unsigned int c = 0;
            std::from_chars(value.data() + i + 1, value.data() + i + 3, c, 16);
            out += static_cast<char>(c);
            i += 2;
        } else {
            out += value[i];
        }
    }

    return out;
}

bool
chunkstore::CaseInsensitiveLess::operator()(const std::string& a,
                                            const std::string& b) const
{
    return std::lexicographical_compare(
      a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
          return std::tolower(static_cast<unsigned char>(x)) <
                 std::tolower(static_cast<unsigned char>(y));
      });
}

size_t
chunkstore::HttpRequest::body_size() const
{
    size_t nbytes = 0;
    for (const auto& segment : body) {
        nbytes += segment.size();
    }
    return nbytes;
}

std::optional<std::string>
chunkstore::HttpRequest::header(const std::string& name) const
{
    if (auto it = headers.find(name); it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string_view
chunkstore::reason_phrase(int status_code)
{
    switch (status_code) {
        case 200:
            return "OK";
        case 204:
            return "No Content";
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 409:
            return "Conflict";
        case 500:
            return "Internal Server Error";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        case 504:
            return "Gateway Timeout";
        default:
            return "";
    }
}
