#include "s3.auth.hh"
#include "unit.test.macros.hh"

#include <chrono>

using namespace chunkstore;

namespace {
std::string
base64url(const std::string& data)
{
    std::string encoded = base64_encode(data);
    for (auto& c : encoded) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

std::string
make_jwt(const nlohmann::json& claims)
{
    return base64url(R"({"alg":"ES256","typ":"JWT"})") + "." +
           base64url(claims.dump()) + ".c2lnbmF0dXJl";
}

long long
seconds_from_now(long long offset)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
             .count() +
           offset;
}

HttpRequest
request_for(const std::string& path)
{
    return HttpRequest(HttpMethod::Get, HttpUrl::parse("http://host:9000" + path));
}

void
check_jwt_decoding()
{
    const auto token = make_jwt({ { "prefix", { "bucket/array" } },
                                  { "exp", seconds_from_now(3600) } });
    const auto claims = decode_jwt_claims(token);
    EXPECT_STR_EQ(claims["prefix"][0].get<std::string>(), "bucket/array");

    EXPECT_THROW(AuthorisationFailed, decode_jwt_claims("not-a-token"));
    EXPECT_THROW(AuthorisationFailed, decode_jwt_claims("a.%%%.c"));
    EXPECT_THROW(AuthorisationFailed,
                 decode_jwt_claims("a." + base64url("{not json") + ".c"));
    EXPECT_THROW(AuthorisationFailed,
                 decode_jwt_claims("a." + base64url("[1, 2]") + ".c"));
    EXPECT_THROW(AuthorisationFailed,
                 decode_jwt_claims(make_jwt(
                   { { "prefix", { "bucket" } }, { "exp", seconds_from_now(-60) } })));
    EXPECT_THROW(AuthorisationFailed,
                 decode_jwt_claims(make_jwt({ { "exp", "tomorrow" } })));
}

void
check_prefixes()
{
    const auto token = make_jwt({ { "prefix", { "bucket/array", "other/" } } });
    BearerAuth auth(token, decode_jwt_claims);
    EXPECT_EQ(int, auth.prefixes().size(), 2);

    auto request = request_for("/bucket/array/00000.npy");
    auth.apply(request);
    EXPECT_STR_EQ(request.header("Authorization").value_or(""), "Bearer " + token);

    // paths are matched after percent-decoding
    auto encoded = request_for("/other/my%20array/00000.npy");
    auth.apply(encoded);

    auto outside = request_for("/bucket/secret/00000.npy");
    EXPECT_THROW(AuthorisationFailed, auth.apply(outside));
    CHECK(!outside.header("Authorization"));

    auto root = request_for("/");
    EXPECT_THROW(AuthorisationFailed, auth.apply(root));

    // a token must list its prefixes
    EXPECT_THROW(AuthorisationFailed,
                 BearerAuth(make_jwt({ { "sub", "someone" } }), decode_jwt_claims));
    EXPECT_THROW(AuthorisationFailed,
                 BearerAuth(make_jwt({ { "prefix", "bucket" } }), decode_jwt_claims));
    EXPECT_THROW(AuthorisationFailed,
                 BearerAuth(make_jwt({ { "prefix", { 1, 2 } } }), decode_jwt_claims));
}

void
check_custom_decoder()
{
    int calls = 0;
    TokenDecoder decoder = [&calls](std::string_view token) {
        ++calls;
        EXPECT_STR_EQ(std::string(token), "opaque");
        return nlohmann::json{ { "prefix", { "" } } };
    };

    const Auth auth = BearerAuth("opaque", decoder);
    EXPECT_EQ(int, calls, 1);

    // the empty prefix covers everything
    auto request = request_for("/anything/at/all");
    apply_auth(auth, request);
    EXPECT_EQ(int, calls, 1);
    EXPECT_STR_EQ(*request.header("Authorization"), "Bearer opaque");

    NoAuth none;
    auto anonymous = request_for("/anything");
    apply_auth(none, anonymous);
    CHECK(anonymous.headers.empty());
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        check_jwt_decoding();
        check_prefixes();
        check_custom_decoder();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
