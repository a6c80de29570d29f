#pragma once

#include "crypto.hh"
#include "http.hh"

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkstore::testing {
struct RecordedRequest
{
    HttpMethod method;
    std::string path;
    std::string query;
    HttpHeaders headers;
    std::string body;
};

/**
 * @brief A minimal in-memory S3 server, path-style, shared by any number of
 * backends. Successful response bodies are streamed in small pieces.
 */
class FakeS3
{
  public:
    size_t piece_size{ 7 };
    size_t page_cap{ 0 };            ///< server-side limit on keys per page
    bool omit_next_marker{ false };
    bool truncate_empty_page{ false }; ///< answer listings with an empty page
    std::string base_path; ///< served below this path, e.g. "/s3"

    // failure injection, applied to every request while set
    bool fail_connection{ false };
    bool fail_timeout{ false };
    int fail_status{ 0 };
    std::string fail_body;
    std::optional<std::string> listing_override;

    HttpResponse handle(const HttpRequest& request)
    {
        std::scoped_lock lock(mutex_);

        RecordedRequest record{ request.method,
                                request.url.path,
                                request.url.query,
                                request.headers,
                                {} };
        for (const auto& segment : request.body) {
            record.body.append(reinterpret_cast<const char*>(segment.data()),
                               segment.size());
        }
        requests_.push_back(record);

        if (fail_connection) {
            return failure_("Failed to connect to fake-s3: refused", false);
        }
        if (fail_timeout) {
            return failure_("Operation timed out", true);
        }
        if (fail_status) {
            return { fail_status, fail_body, {}, false };
        }

        std::string path = percent_decode(request.url.path);
        if (!base_path.empty()) {
            if (!path.starts_with(base_path)) {
                return { 404, {}, {}, false };
            }
            path.erase(0, base_path.size());
        }
        if (path.starts_with('/')) {
            path.erase(0, 1);
        }
        const auto slash = path.find('/');
        const std::string bucket = path.substr(0, slash);
        const std::string key =
          slash == std::string::npos ? std::string{} : path.substr(slash + 1);

        if (bucket.empty()) {
            return { 200,
                     "<ListAllMyBucketsResult><Buckets/>"
                     "</ListAllMyBucketsResult>",
                     {},
                     false };
        }
        if (key.empty()) {
            return handle_bucket_(request, bucket, record.body);
        }
        return handle_object_(request, bucket, key, record.body);
    }

    std::vector<RecordedRequest> requests() const
    {
        std::scoped_lock lock(mutex_);
        return requests_;
    }

    size_t request_count() const
    {
        std::scoped_lock lock(mutex_);
        return requests_.size();
    }

    RecordedRequest last_request() const
    {
        std::scoped_lock lock(mutex_);
        return requests_.back();
    }

    bool has_bucket(const std::string& bucket) const
    {
        std::scoped_lock lock(mutex_);
        return buckets_.contains(bucket);
    }

    std::optional<std::string> object(const std::string& bucket,
                                      const std::string& key) const
    {
        std::scoped_lock lock(mutex_);
        auto b = buckets_.find(bucket);
        if (b == buckets_.end()) {
            return std::nullopt;
        }
        auto o = b->second.find(key);
        if (o == b->second.end()) {
            return std::nullopt;
        }
        return o->second;
    }

    void put_object(const std::string& bucket,
                    const std::string& key,
                    std::string data)
    {
        std::scoped_lock lock(mutex_);
        buckets_[bucket][key] = std::move(data);
    }

    std::optional<std::string> subresource(const std::string& bucket,
                                           const std::string& name) const
    {
        std::scoped_lock lock(mutex_);
        auto it = subresources_.find(bucket + "?" + name);
        if (it == subresources_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::string>> buckets_;
    std::map<std::string, std::string> subresources_;
    std::vector<RecordedRequest> requests_;

    static HttpResponse failure_(const std::string& error, bool timed_out)
    {
        HttpResponse response;
        response.error = error;
        response.timed_out = timed_out;
        return response;
    }

    static HttpResponse error_(int status, const std::string& code)
    {
        return { status,
                 "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<Error><Code>" +
                   code + "</Code><Message>" + code +
                   " (fake)</Message></Error>",
                 {},
                 false };
    }

    static std::map<std::string, std::string> parse_query_(
      std::string_view query)
    {
        std::map<std::string, std::string> params;
        while (!query.empty()) {
            const auto amp = query.find('&');
            const auto param = query.substr(0, amp);
            const auto eq = param.find('=');
            params[percent_decode(param.substr(0, eq))] =
              eq == std::string_view::npos
                ? std::string{}
                : percent_decode(param.substr(eq + 1));
            if (amp == std::string_view::npos) {
                break;
            }
            query.remove_prefix(amp + 1);
        }
        return params;
    }

    static bool digest_ok_(const HttpRequest& request, const std::string& body)
    {
        const auto md5 = request.header("Content-MD5");
        if (!md5) {
            return true;
        }
        ByteSegments segments;
        if (!body.empty()) {
            segments.push_back(std::as_bytes(std::span(body.data(), body.size())));
        }
        return *md5 == content_md5(segments);
    }

    HttpResponse handle_bucket_(const HttpRequest& request,
                                const std::string& bucket,
                                const std::string& body)
    {
        const auto params = parse_query_(request.url.query);

        if (request.method == HttpMethod::Put) {
            if (params.empty()) {
                if (buckets_.contains(bucket)) {
                    return error_(409, "BucketAlreadyOwnedByYou");
                }
                buckets_[bucket];
                return { 200, {}, {}, false };
            }
            if (!buckets_.contains(bucket)) {
                return error_(404, "NoSuchBucket");
            }
            if (!digest_ok_(request, body)) {
                return error_(400, "BadDigest");
            }
            subresources_[bucket + "?" + params.begin()->first] = body;
            return { 204, {}, {}, false };
        }

        if (request.method != HttpMethod::Get) {
            return error_(405, "MethodNotAllowed");
        }
        if (!buckets_.contains(bucket)) {
            return error_(404, "NoSuchBucket");
        }
        if (listing_override) {
            return { 200, *listing_override, {}, false };
        }
        return list_(bucket, params);
    }

    HttpResponse list_(const std::string& bucket,
                       const std::map<std::string, std::string>& params)
    {
        auto get = [&params](const std::string& name) {
            auto it = params.find(name);
            return it == params.end() ? std::string{} : it->second;
        };
        const std::string prefix = get("prefix");
        const std::string marker = get("marker");
        size_t max_keys = get("max-keys").empty()
                            ? 1000
                            : std::stoul(get("max-keys"));
        if (page_cap) {
            max_keys = std::min(max_keys, page_cap);
        }

        std::vector<std::string> keys;
        bool truncated = false;
        for (const auto& [key, data] : buckets_[bucket]) {
            if (!key.starts_with(prefix) || key <= marker) {
                continue;
            }
            if (keys.size() == max_keys) {
                truncated = true;
                break;
            }
            keys.push_back(key);
        }
        if (truncate_empty_page) {
            keys.clear();
            truncated = true;
        }

        std::string xml =
          "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
          "<ListBucketResult "
          "xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\"><Name>" +
          bucket + "</Name><Prefix>" + prefix + "</Prefix><Marker>" + marker +
          "</Marker><MaxKeys>" + std::to_string(max_keys) +
          "</MaxKeys><IsTruncated>" + (truncated ? "true" : "false") +
          "</IsTruncated>";
        if (truncated && !omit_next_marker && !keys.empty()) {
            xml += "<NextMarker>" + keys.back() + "</NextMarker>";
        }
        for (const auto& key : keys) {
            xml += "<Contents><Key>" + key + "</Key><Size>" +
                   std::to_string(buckets_[bucket][key].size()) +
                   "</Size></Contents>";
        }
        return { 200, xml + "</ListBucketResult>", {}, false };
    }

    HttpResponse handle_object_(const HttpRequest& request,
                                const std::string& bucket,
                                const std::string& key,
                                const std::string& body)
    {
        auto b = buckets_.find(bucket);
        if (b == buckets_.end()) {
            return error_(404, "NoSuchBucket");
        }

        switch (request.method) {
            case HttpMethod::Put:
                if (!digest_ok_(request, body)) {
                    return error_(400, "BadDigest");
                }
                b->second[key] = body;
                return { 200, {}, {}, false };
            case HttpMethod::Head:
                if (!b->second.contains(key)) {
                    return { 404, {}, {}, false };
                }
                return { 200, {}, {}, false };
            case HttpMethod::Get:
                break;
            default:
                return error_(405, "MethodNotAllowed");
        }

        auto o = b->second.find(key);
        if (o == b->second.end()) {
            return error_(404, "NoSuchKey");
        }
        if (!request.on_body) {
            return { 200, o->second, {}, false };
        }

        HttpResponse response{ 200, {}, {}, false };
        const auto data = std::as_bytes(std::span(o->second.data(), o->second.size()));
        for (size_t offset = 0; offset < data.size(); offset += piece_size) {
            const auto n = std::min(piece_size, data.size() - offset);
            if (!request.on_body(data.subspan(offset, n))) {
                response.error = "Failure writing output to destination";
                break;
            }
        }
        return response;
    }
};

class FakeS3Backend final : public HttpBackend
{
  public:
    explicit FakeS3Backend(std::shared_ptr<FakeS3> s3)
      : s3_{ std::move(s3) }
    {
    }

    HttpResponse execute(const HttpRequest& request) override
    {
        return s3_->handle(request);
    }

  private:
    std::shared_ptr<FakeS3> s3_;
};

inline HttpBackendFactory
fake_backend_factory(std::shared_ptr<FakeS3> s3)
{
    return [s3]() { return std::make_unique<FakeS3Backend>(s3); };
}

inline S3ChunkStoreSettings
fake_settings()
{
    S3ChunkStoreSettings settings;
    settings.url = "http://fake-s3:9000";
    return settings;
}
} // namespace chunkstore::testing
