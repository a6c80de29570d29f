#include "s3.auth.hh"
#include "macros.hh"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>

namespace {
// sub-resources that are part of the v2 canonical resource
constexpr std::string_view signed_subresources[] = {
    "acl",       "cors",           "delete",        "lifecycle",
    "location",  "logging",        "notification",  "partNumber",
    "policy",    "requestPayment", "tagging",       "torrent",
    "uploadId",  "uploads",        "versionId",     "versioning",
    "versions",  "website",
};

std::string
to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string
http_date_now()
{
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);

    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return buf;
}

std::string
canonical_resource(const chunkstore::HttpUrl& url)
{
    std::vector<std::pair<std::string, std::string>> params;

    std::string_view query = url.query;
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto param = query.substr(0, amp);
        const auto eq = param.find('=');
        const std::string key(param.substr(0, eq));

        if (std::find(std::begin(signed_subresources),
                      std::end(signed_subresources),
                      key) != std::end(signed_subresources)) {
            params.emplace_back(
              key,
              eq == std::string_view::npos
                ? std::string{}
                : chunkstore::percent_decode(param.substr(eq + 1)));
        }

        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    std::sort(params.begin(), params.end());

    std::string resource = url.path;
    char separator = '?';
    for (const auto& [key, value] : params) {
        resource += separator + key;
        if (!value.empty()) {
            resource += "=" + value;
        }
        separator = '&';
    }
    return resource;
}
} // namespace

nlohmann::json
chunkstore::decode_jwt_claims(std::string_view token)
{
    const auto first_dot = token.find('.');
    const auto second_dot = first_dot == std::string_view::npos
                              ? std::string_view::npos
                              : token.find('.', first_dot + 1);
    EXPECT_OR_RAISE(second_dot != std::string_view::npos,
                    AuthorisationFailed,
                    "Invalid token: expected three dot-separated parts");

    nlohmann::json claims;
    try {
        claims = nlohmann::json::parse(base64_decode(
          token.substr(first_dot + 1, second_dot - first_dot - 1)));
    } catch (const std::exception& exc) {
        const std::string err = LOG_ERROR("Invalid token: ", exc.what());
        throw AuthorisationFailed(err);
    }
    EXPECT_OR_RAISE(claims.is_object(),
                    AuthorisationFailed,
                    "Invalid token: claims are not a JSON object");

    if (auto it = claims.find("exp"); it != claims.end()) {
        EXPECT_OR_RAISE(it->is_number(),
                        AuthorisationFailed,
                        "Invalid token: 'exp' claim is not a number");
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
        EXPECT_OR_RAISE(it->get<double>() > static_cast<double>(now),
                        AuthorisationFailed,
                        "Token has expired");
    }

    return claims;
}

chunkstore::BearerAuth::BearerAuth(std::string token,
                                   const TokenDecoder& decode,
                                   std::string_view base_path)
  : token_{ std::move(token) }
  , base_path_{ percent_decode(base_path) }
{
    while (base_path_.ends_with('/')) {
        base_path_.pop_back();
    }

    const nlohmann::json claims = decode(token_);

    auto it = claims.find("prefix");
    EXPECT_OR_RAISE(it != claims.end() && it->is_array(),
                    AuthorisationFailed,
                    "Token lacks a 'prefix' claim listing accessible paths");
    for (const auto& prefix : *it) {
        EXPECT_OR_RAISE(prefix.is_string(),
                        AuthorisationFailed,
                        "Token 'prefix' claim holds a non-string");
        prefixes_.push_back(prefix.get<std::string>());
    }
}

std::string
chunkstore::BearerAuth::store_path_(const HttpUrl& url) const
{
    std::string path = percent_decode(url.path);
    if (path.starts_with(base_path_) &&
        (path.size() == base_path_.size() || path[base_path_.size()] == '/')) {
        path.erase(0, base_path_.size());
    }
    if (path.starts_with('/')) {
        path.erase(0, 1);
    }
    return path;
}

void
chunkstore::BearerAuth::apply(HttpRequest& request) const
{
    const std::string path = store_path_(request.url);

    const bool allowed =
      std::any_of(prefixes_.begin(),
                  prefixes_.end(),
                  [&path](const std::string& p) { return path.starts_with(p); });
    EXPECT_OR_RAISE(allowed,
                    AuthorisationFailed,
                    "Token does not grant access to '",
                    path,
                    "'");

    request.headers["Authorization"] = "Bearer " + token_;
}

chunkstore::SignedAuth::SignedAuth(std::string access_key,
                                   std::string secret_key)
  : access_key_{ std::move(access_key) }
  , secret_key_{ std::move(secret_key) }
{
}

void
chunkstore::SignedAuth::apply(HttpRequest& request) const
{
    if (!request.header("Date") && !request.header("x-amz-date")) {
        request.headers["Date"] = http_date_now();
    }
    request.headers["Authorization"] =
      "AWS " + access_key_ + ":" + signature(request);
}

std::string
chunkstore::SignedAuth::string_to_sign(const HttpRequest& request) const
{
    std::string s(to_string(request.method));
    s += "\n" + request.header("Content-MD5").value_or("");
    s += "\n" + request.header("Content-Type").value_or("");
    // x-amz-date supersedes Date, which is then signed as empty
    s += "\n" + (request.header("x-amz-date")
                   ? std::string{}
                   : request.header("Date").value_or(""));
    s += "\n";

    // headers are already sorted case-insensitively
    for (const auto& [key, value] : request.headers) {
        const auto name = to_lower(key);
        if (name.starts_with("x-amz-")) {
            s += name + ":" + value + "\n";
        }
    }

    return s + canonical_resource(request.url);
}

std::string
chunkstore::SignedAuth::signature(const HttpRequest& request) const
{
    return base64_encode(hmac_sha1(secret_key_, string_to_sign(request)));
}

void
chunkstore::apply_auth(const Auth& auth, HttpRequest& request)
{
    std::visit([&request](const auto& a) { a.apply(request); }, auth);
}
