#pragma once

#include "http.hh"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chunkstore {
/// Turns a bearer token into its claims. Throws AuthorisationFailed.
using TokenDecoder = std::function<nlohmann::json(std::string_view token)>;

/**
 * @brief Decode the claims of a JSON Web Token.
 *
 * The signature is not verified here; that is up to the store. Only the
 * claims needed to scope requests client-side are extracted.
 *
 * @throw AuthorisationFailed if @p token is not a well-formed JWT or has
 * expired.
 */
nlohmann::json
decode_jwt_claims(std::string_view token);

/// Anonymous access.
class NoAuth
{
  public:
    void apply(HttpRequest&) const {}
};

/**
 * @brief Bearer token access, restricted to the path prefixes listed in the
 * token's "prefix" claim.
 */
class BearerAuth
{
  public:
    /**
     * @param base_path Path of the endpoint itself. Prefixes are matched
     * against what follows it.
     * @throw AuthorisationFailed if the token is malformed, expired or lacks
     * a "prefix" claim.
     */
    BearerAuth(std::string token,
               const TokenDecoder& decode,
               std::string_view base_path = {});

    /**
     * @brief Attach the token to @p request.
     * @throw AuthorisationFailed if the token does not cover the request
     * path. Nothing has been sent at this point.
     */
    void apply(HttpRequest& request) const;

    const std::vector<std::string>& prefixes() const noexcept
    {
        return prefixes_;
    }

  private:
    std::string token_;
    std::string base_path_;
    std::vector<std::string> prefixes_;

    std::string store_path_(const HttpUrl& url) const;
};

/**
 * @brief Static key access, signing each request with AWS signature
 * version 2 (HMAC-SHA1).
 */
class SignedAuth
{
  public:
    SignedAuth(std::string access_key, std::string secret_key);

    /// Add Date (if missing) and Authorization headers to @p request.
    void apply(HttpRequest& request) const;

    std::string string_to_sign(const HttpRequest& request) const;
    std::string signature(const HttpRequest& request) const;

  private:
    std::string access_key_;
    std::string secret_key_;
};

using Auth = std::variant<NoAuth, BearerAuth, SignedAuth>;

void
apply_auth(const Auth& auth, HttpRequest& request);
} // namespace chunkstore
