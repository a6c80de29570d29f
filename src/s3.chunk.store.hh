#pragma once

#include "chunkstore.hh"
#include "http.hh"
#include "s3.auth.hh"
#include "session.pool.hh"

#include <memory>
#include <string>
#include <utility>

namespace chunkstore {
/**
 * @brief A ChunkStore backed by an S3-compatible object store.
 *
 * The first component of an array name is the bucket and the rest is the
 * path of the array within it. Each chunk is an NPY object at
 * "<path>/<index string>.npy". Safe to share between threads.
 */
class S3ChunkStore final : public ChunkStore
{
  public:
    /**
     * @brief Connect to the store and check that it responds.
     * @param settings Endpoint, credentials and bucket options.
     * @param backend_factory Makes the HTTP backend of each new session.
     * @param decode_token Extracts the claims of a bearer token.
     * @throw StoreUnavailable if the settings are invalid or the store is
     * unreachable.
     * @throw AuthorisationFailed if the credentials are rejected.
     */
    S3ChunkStore(const S3ChunkStoreSettings& settings,
                 HttpBackendFactory backend_factory,
                 const TokenDecoder& decode_token = decode_jwt_claims);

    /// Connect over HTTP(S) with the minio-cpp backend.
    static std::unique_ptr<S3ChunkStore> from_url(
      const S3ChunkStoreSettings& settings);

    ArrayChunk get_chunk(std::string_view array_name,
                         const SliceSpec& slices,
                         const DataType& dtype) override;
    void put_chunk(std::string_view array_name,
                   const SliceSpec& slices,
                   const ArrayChunk& chunk) override;
    bool has_chunk(std::string_view array_name,
                   const SliceSpec& slices,
                   const DataType& dtype) override;
    std::vector<std::string> list_chunk_ids(
      std::string_view array_name) override;
    void create_array(std::string_view array_name) override;
    void mark_complete(std::string_view array_name) override;
    bool is_complete(std::string_view array_name) override;

  private:
    S3ChunkStoreSettings settings_;
    HttpUrl base_url_;
    size_t base_segments_;
    std::shared_ptr<const Auth> auth_;
    SessionPool pool_;

    HttpUrl bucket_url_(std::string_view bucket, std::string query = {}) const;
    HttpUrl object_url_(std::string_view bucket, std::string_view key) const;

    /// Bucket and object key of a chunk.
    std::pair<std::string, std::string> chunk_location_(
      std::string_view chunk_name) const;

    /**
     * @brief Send @p request through a pooled session.
     * @throw ChunkStoreError for unsuccessful statuses not in @p ignored.
     */
    HttpResponse request_(HttpRequest& request,
                          std::initializer_list<int> ignored = {});

    void put_document_(std::string_view bucket,
                       std::string_view subresource,
                       const std::string& document,
                       const std::string& content_type);

    void smoke_test_();
};
} // namespace chunkstore
