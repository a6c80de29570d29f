#include "s3.status.hh"
#include "unit.test.macros.hh"

using namespace chunkstore;

namespace {
HttpRequest
request_for(const std::string& url)
{
    return HttpRequest(HttpMethod::Get, HttpUrl::parse(url));
}

HttpResponse
response_with(int status, std::string body = {})
{
    return HttpResponse{ status, std::move(body) };
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        const auto object = request_for("http://host:9000/bucket/array/00000.npy");
        const auto bucket = request_for("http://host:9000/bucket?prefix=array");
        const auto root = request_for("http://host:9000/");

        raise_for_status(object, response_with(200));
        raise_for_status(object, response_with(204));
        raise_for_status(bucket, response_with(409), { 409 });

        EXPECT_THROW(AuthorisationFailed,
                     raise_for_status(object, response_with(401)));
        EXPECT_THROW(AuthorisationFailed,
                     raise_for_status(root, response_with(401)));

        EXPECT_THROW(ChunkNotFound, raise_for_status(object, response_with(404)));
        EXPECT_THROW(ChunkNotFound, raise_for_status(object, response_with(403)));
        EXPECT_THROW(StoreUnavailable,
                     raise_for_status(bucket, response_with(404)));
        EXPECT_THROW(StoreUnavailable,
                     raise_for_status(bucket, response_with(403)));
        EXPECT_THROW(StoreUnavailable, raise_for_status(root, response_with(403)));

        EXPECT_THROW(StoreUnavailable,
                     raise_for_status(object, response_with(500)));
        EXPECT_THROW(StoreUnavailable,
                     raise_for_status(object, response_with(503)));
        EXPECT_THROW(StoreUnavailable,
                     raise_for_status(bucket, response_with(409)));
        EXPECT_THROW(StoreUnavailable,
                     raise_for_status(object, response_with(301)));

        // the endpoint's own path segments are not counted
        const auto gateway = request_for("http://host/s3/bucket");
        EXPECT_THROW(ChunkNotFound,
                     raise_for_status(gateway, response_with(404)));
        EXPECT_THROW(StoreUnavailable,
                     raise_for_status(gateway, response_with(404), {}, 1));

        // AuthorisationFailed is not a kind of StoreUnavailable
        try {
            raise_for_status(object, response_with(401));
        } catch (const StoreUnavailable&) {
            CHECK(false);
        } catch (const AuthorisationFailed&) {
        }

        const std::string error_body =
          "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
          "<Error><Code>NoSuchKey</Code>"
          "<Message>The specified key does not exist.</Message>"
          "<Key>array/00000.npy</Key></Error>";
        const auto info = parse_s3_error(error_body);
        EXPECT_STR_EQ(info.code, "NoSuchKey");
        EXPECT_STR_EQ(info.message, "The specified key does not exist.");
        CHECK(parse_s3_error("").code.empty());
        CHECK(parse_s3_error("<html>oops").code.empty());

        try {
            raise_for_status(object, response_with(404, error_body));
            CHECK(false);
        } catch (const ChunkNotFound& exc) {
            const std::string what = exc.what();
            CHECK(what.find("404 Not Found") != std::string::npos);
            CHECK(what.find("NoSuchKey") != std::string::npos);
            CHECK(what.find("/bucket/array/00000.npy") != std::string::npos);
        }

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
