#include "s3.chunk.store.hh"
#include "macros.hh"
#include "minio.http.backend.hh"
#include "npy.codec.hh"
#include "s3.listing.hh"
#include "s3.policies.hh"
#include "s3.status.hh"

#include <cmath>

namespace {
constexpr std::string_view chunk_suffix = ".npy";
constexpr std::string_view complete_key = "complete";

const chunkstore::S3ChunkStoreSettings&
validated(const chunkstore::S3ChunkStoreSettings& settings)
{
    using chunkstore::StoreUnavailable;

    EXPECT_OR_RAISE(
      !settings.url.empty(), StoreUnavailable, "S3 endpoint URL is empty");
    EXPECT_OR_RAISE(settings.token.empty() || (settings.access_key.empty() &&
                                               settings.secret_key.empty()),
                    StoreUnavailable,
                    "Specify either a bearer token or access keys, not both");
    EXPECT_OR_RAISE(settings.access_key.empty() == settings.secret_key.empty(),
                    StoreUnavailable,
                    "Access key and secret key must be given together");
    EXPECT_OR_RAISE(settings.list_max_keys > 0,
                    StoreUnavailable,
                    "list_max_keys must be positive");
    return settings;
}

chunkstore::HttpUrl
parse_base_url(const std::string& url)
{
    chunkstore::HttpUrl base;
    try {
        base = chunkstore::HttpUrl::parse(url);
    } catch (const std::invalid_argument& exc) {
        const std::string err =
          LOG_ERROR("Invalid S3 endpoint '", url, "': ", exc.what());
        throw chunkstore::StoreUnavailable(err);
    }
    EXPECT_OR_RAISE(base.query.empty(),
                    chunkstore::StoreUnavailable,
                    "S3 endpoint '",
                    url,
                    "' must not have a query string");

    while (base.path.ends_with('/')) {
        base.path.pop_back();
    }
    return base;
}

std::shared_ptr<const chunkstore::Auth>
make_auth(const chunkstore::S3ChunkStoreSettings& settings,
          const chunkstore::HttpUrl& base_url,
          const chunkstore::TokenDecoder& decode_token)
{
    using namespace chunkstore;

    if (!settings.token.empty()) {
        return std::make_shared<const Auth>(
          BearerAuth(settings.token, decode_token, base_url.path));
    }
    if (!settings.access_key.empty()) {
        return std::make_shared<const Auth>(
          SignedAuth(settings.access_key, settings.secret_key));
    }
    return std::make_shared<const Auth>(NoAuth{});
}

std::optional<std::chrono::milliseconds>
request_timeout(double timeout_s)
{
    if (timeout_s <= 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(std::llround(timeout_s * 1000));
}

chunkstore::ChunkStore::ErrorMap
s3_error_map()
{
    using chunkstore::ErrorKind;
    using chunkstore::TransportFault;

    auto is = [](TransportFault fault) {
        return [fault](TransportFault f) { return f == fault; };
    };

    return {
        { is(TransportFault::Connection), ErrorKind::StoreUnavailable },
        { is(TransportFault::Timeout), ErrorKind::StoreUnavailable },
        { is(TransportFault::MalformedResponse), ErrorKind::StoreUnavailable },
    };
}

chunkstore::ByteSegments
as_body(const std::string& document)
{
    if (document.empty()) {
        return {};
    }
    return { std::as_bytes(std::span(document.data(), document.size())) };
}

std::string
describe(const chunkstore::DataType& dtype, const chunkstore::Shape& shape)
{
    return "dtype " + dtype.descr() + " and shape " +
           chunkstore::format_shape(shape);
}
} // namespace

chunkstore::S3ChunkStore::S3ChunkStore(const S3ChunkStoreSettings& settings,
                                       HttpBackendFactory backend_factory,
                                       const TokenDecoder& decode_token)
  : ChunkStore(s3_error_map())
  , settings_{ validated(settings) }
  , base_url_{ parse_base_url(settings.url) }
  , base_segments_{ base_url_.path_segments() }
  , auth_{ make_auth(settings, base_url_, decode_token) }
  , pool_{ [factory = std::move(backend_factory),
            auth = auth_,
            timeout = request_timeout(settings.timeout_s)]() {
      LOG_DEBUG("Opening a new session");
      return std::make_unique<Session>(factory(), auth, timeout);
  } }
{
    // a token scoped to path prefixes cannot list the buckets
    if (!std::holds_alternative<BearerAuth>(*auth_)) {
        smoke_test_();
    }
}

std::unique_ptr<chunkstore::S3ChunkStore>
chunkstore::S3ChunkStore::from_url(const S3ChunkStoreSettings& settings)
{
    const auto max_retries = settings.max_retries;
    return std::make_unique<S3ChunkStore>(settings, [max_retries]() {
        return std::make_unique<MinioHttpBackend>(max_retries);
    });
}

chunkstore::ArrayChunk
chunkstore::S3ChunkStore::get_chunk(std::string_view array_name,
                                    const SliceSpec& slices,
                                    const DataType& dtype)
{
    const auto metadata = chunk_metadata(array_name, slices, dtype);
    const auto& chunk_name = metadata.chunk_name;
    const auto location = chunk_location_(chunk_name);

    return standard_errors(chunk_name, [&]() {
        HttpRequest request(HttpMethod::Get,
                            object_url_(location.first, location.second));
        request.headers["Accept-Encoding"] = "identity";

        NpyReader reader;
        request.on_body = [&reader](std::span<const std::byte> data) {
            return reader.consume(data);
        };

        try {
            request_(request);
        } catch (const TransportError&) {
            // the decoder aborted the transfer
            EXPECT_GOOD_CHUNK(
              !reader.failed(), "Chunk ", chunk_name, ": ", reader.error());
            throw;
        }

        ArrayChunk chunk = reader.finish();
        EXPECT_GOOD_CHUNK(chunk.dtype() == dtype &&
                            chunk.shape() == metadata.shape,
                          "Chunk ",
                          chunk_name,
                          ": ",
                          describe(chunk.dtype(), chunk.shape()),
                          " differs from expected ",
                          describe(dtype, metadata.shape));
        return chunk;
    });
}

void
chunkstore::S3ChunkStore::put_chunk(std::string_view array_name,
                                    const SliceSpec& slices,
                                    const ArrayChunk& chunk)
{
    const auto metadata = chunk_metadata(array_name, slices, chunk);
    const auto& chunk_name = metadata.chunk_name;
    const auto location = chunk_location_(chunk_name);
    const EncodedChunk encoded = encode_chunk(chunk);

    standard_errors(chunk_name, [&]() {
        HttpRequest request(HttpMethod::Put,
                            object_url_(location.first, location.second));
        request.headers["Content-Type"] = "application/octet-stream";
        request.headers["Content-MD5"] = encoded.md5;
        request.headers["Content-Length"] = std::to_string(encoded.nbytes());
        request.body = encoded.segments();

        request_(request);
    });
}

bool
chunkstore::S3ChunkStore::has_chunk(std::string_view array_name,
                                    const SliceSpec& slices,
                                    const DataType& dtype)
{
    const auto metadata = chunk_metadata(array_name, slices, dtype);
    const auto& chunk_name = metadata.chunk_name;
    const auto location = chunk_location_(chunk_name);

    try {
        standard_errors(chunk_name, [&]() {
            HttpRequest request(HttpMethod::Head,
                                object_url_(location.first, location.second));
            request_(request);
        });
    } catch (const ChunkNotFound&) {
        return false;
    }
    return true;
}

std::vector<std::string>
chunkstore::S3ChunkStore::list_chunk_ids(std::string_view array_name)
{
    const auto parts = split(array_name, 1);
    const std::string& bucket = parts[0];
    const std::string path = parts.size() > 1 ? parts[1] : std::string{};
    const std::string key_prefix = path.empty() ? path : path + "/";

    return standard_errors({}, [&]() {
        std::vector<std::string> chunk_ids;
        std::string marker;

        while (true) {
            std::string query = "prefix=" + encode_query_value(path) +
                                "&max-keys=" +
                                std::to_string(settings_.list_max_keys);
            if (!marker.empty()) {
                query += "&marker=" + encode_query_value(marker);
            }

            HttpRequest request(HttpMethod::Get,
                                bucket_url_(bucket, std::move(query)));
            const HttpResponse response = request_(request);
            const ListBucketPage page = parse_list_bucket_result(response.body);

            for (const auto& key : page.keys) {
                if (key.size() >= key_prefix.size() + chunk_suffix.size() &&
                    key.starts_with(key_prefix) &&
                    key.ends_with(chunk_suffix)) {
                    chunk_ids.push_back(
                      key.substr(key_prefix.size(),
                                 key.size() - key_prefix.size() -
                                   chunk_suffix.size()));
                }
            }

            if (!page.is_truncated) {
                break;
            }
            if (page.keys.empty()) {
                LOG_WARNING("Listing of '",
                            array_name,
                            "' is truncated but the page holds no keys; "
                            "stopping at ",
                            chunk_ids.size(),
                            " chunks");
                break;
            }
            marker =
              page.next_marker.empty() ? page.keys.back() : page.next_marker;
        }

        return chunk_ids;
    });
}

void
chunkstore::S3ChunkStore::create_array(std::string_view array_name)
{
    const std::string bucket = split(array_name, 1)[0];

    standard_errors({}, [&]() {
        HttpRequest request(HttpMethod::Put, bucket_url_(bucket));
        request.headers["Content-Length"] = "0";
        // the bucket may already exist (and be ours)
        request_(request, { 409 });

        if (settings_.public_read) {
            put_document_(bucket,
                          "policy",
                          public_read_policy(bucket),
                          "application/json");
        }
        if (settings_.expiry_days > 0) {
            put_document_(bucket,
                          "lifecycle",
                          expiry_lifecycle(settings_.expiry_days),
                          "text/xml");
        }
    });
}

void
chunkstore::S3ChunkStore::mark_complete(std::string_view array_name)
{
    create_array(array_name);

    const auto name = join({ array_name, complete_key });
    const auto parts = split(name, 1);

    standard_errors(name, [&]() {
        HttpRequest request(HttpMethod::Put, object_url_(parts[0], parts[1]));
        request.headers["Content-Length"] = "0";
        request_(request);
    });
}

bool
chunkstore::S3ChunkStore::is_complete(std::string_view array_name)
{
    const auto name = join({ array_name, complete_key });
    const auto parts = split(name, 1);

    try {
        standard_errors(name, [&]() {
            HttpRequest request(HttpMethod::Get,
                                object_url_(parts[0], parts[1]));
            request_(request);
        });
    } catch (const ChunkNotFound&) {
        return false;
    }
    return true;
}

chunkstore::HttpUrl
chunkstore::S3ChunkStore::bucket_url_(std::string_view bucket,
                                      std::string query) const
{
    HttpUrl url = base_url_;
    url.path += "/" + encode_path(bucket);
    url.query = std::move(query);
    return url;
}

chunkstore::HttpUrl
chunkstore::S3ChunkStore::object_url_(std::string_view bucket,
                                      std::string_view key) const
{
    HttpUrl url = base_url_;
    url.path += "/" + encode_path(std::string(bucket) + "/" + std::string(key));
    return url;
}

std::pair<std::string, std::string>
chunkstore::S3ChunkStore::chunk_location_(std::string_view chunk_name) const
{
    auto parts = split(chunk_name, 1);
    EXPECT_GOOD_CHUNK(parts.size() == 2,
                      "Chunk name '",
                      chunk_name,
                      "' lacks a bucket component");
    return { std::move(parts[0]), parts[1] + std::string(chunk_suffix) };
}

chunkstore::HttpResponse
chunkstore::S3ChunkStore::request_(HttpRequest& request,
                                   std::initializer_list<int> ignored)
{
    ScopedSession session(pool_);
    HttpResponse response = session->send(request);
    raise_for_status(request, response, ignored, base_segments_);
    return response;
}

void
chunkstore::S3ChunkStore::put_document_(std::string_view bucket,
                                        std::string_view subresource,
                                        const std::string& document,
                                        const std::string& content_type)
{
    HttpRequest request(HttpMethod::Put,
                        bucket_url_(bucket, std::string(subresource)));
    request.body = as_body(document);
    request.headers["Content-Type"] = content_type;
    request.headers["Content-MD5"] = content_md5(request.body);
    request.headers["Content-Length"] = std::to_string(document.size());

    request_(request);
}

void
chunkstore::S3ChunkStore::smoke_test_()
{
    try {
        standard_errors({}, [this]() {
            HttpUrl url = base_url_;
            if (url.path.empty()) {
                url.path = "/";
            }
            HttpRequest request(HttpMethod::Get, std::move(url));
            request_(request);
        });
    } catch (const StoreUnavailable& exc) {
        LOG_WARNING(
          "Store at ", settings_.url, " failed smoke test: ", exc.what());
        throw;
    }
}

std::unique_ptr<chunkstore::ChunkStore>
chunkstore::open_s3_chunk_store(const S3ChunkStoreSettings& settings)
{
    return S3ChunkStore::from_url(settings);
}
