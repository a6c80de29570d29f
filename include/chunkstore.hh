#ifndef H_CHUNKSTORE_V0
#define H_CHUNKSTORE_V0

#include "chunkstore.types.h"

#include <algorithm>
#include <bit>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace chunkstore {
void
set_log_level(ChunkStoreLogLevel level);

ChunkStoreLogLevel
get_log_level();

/// Base class of every error raised through the ChunkStore interface.
class ChunkStoreError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// The store could not be reached or misbehaved. Worth retrying later.
class StoreUnavailable : public ChunkStoreError
{
  public:
    using ChunkStoreError::ChunkStoreError;
};

/// The requested chunk does not exist in the store.
class ChunkNotFound : public ChunkStoreError
{
  public:
    using ChunkStoreError::ChunkStoreError;
};

/// The chunk or its slice specification is malformed or inconsistent.
class BadChunk : public ChunkStoreError
{
  public:
    using ChunkStoreError::ChunkStoreError;
};

/// Credentials are missing, invalid, expired or do not cover the request.
class AuthorisationFailed : public ChunkStoreError
{
  public:
    using ChunkStoreError::ChunkStoreError;
};

enum class ErrorKind
{
    StoreUnavailable,
    ChunkNotFound,
    BadChunk,
    AuthorisationFailed,
};

/**
 * @brief Throw the exception type corresponding to @p kind.
 * @param kind The kind of error.
 * @param message The exception message.
 */
[[noreturn]] void
raise_error(ErrorKind kind, const std::string& message);

/**
 * @brief Low-level fault reported by a transport, before translation into
 * one of the ChunkStoreError types.
 */
enum class TransportFault
{
    Connection,
    Timeout,
    MalformedResponse,
};

class TransportError : public std::runtime_error
{
  public:
    TransportError(TransportFault fault, const std::string& message)
      : std::runtime_error(message)
      , fault_{ fault }
    {
    }

    TransportFault fault() const noexcept { return fault_; }

  private:
    TransportFault fault_;
};

/**
 * @brief NPY-style data type descriptor, e.g. "<f8", "|b1" or "<c8".
 */
struct DataType
{
    char byte_order{ '|' };
    char kind{ 'u' };
    size_t itemsize{ 1 };

    /**
     * @brief Parse a descriptor string.
     * @param descr The descriptor, e.g. "<i4". A missing byte order character
     * means native order.
     * @throw BadChunk if the descriptor is not understood.
     */
    static DataType from_descr(std::string_view descr);

    template<typename T>
    static DataType of();

    std::string descr() const;

    /// Object dtypes hold references and are never serialized.
    bool is_object() const noexcept { return kind == 'O'; }

    bool operator==(const DataType& other) const noexcept;
};

using Shape = std::vector<size_t>;

/**
 * @brief A half-open range along one dimension. Open ends are representable
 * so that they can be rejected when validating a slice specification.
 */
struct Slice
{
    Slice() = default;
    Slice(std::optional<int64_t> start,
          std::optional<int64_t> stop,
          int64_t step = 1)
      : start(start)
      , stop(stop)
      , step(step)
    {
    }

    std::optional<int64_t> start;
    std::optional<int64_t> stop;
    int64_t step{ 1 };
};

using SliceSpec = std::vector<Slice>;

/// Block lengths per dimension, summing to that dimension's extent.
using ChunkPartition = std::vector<std::vector<size_t>>;

/**
 * @brief An owned N-dimensional array, stored as one contiguous buffer in
 * either C (row-major) or Fortran (column-major) order.
 */
class ArrayChunk
{
  public:
    ArrayChunk() = default;
    ArrayChunk(Shape shape, DataType dtype, bool fortran_order = false);

    template<typename T>
    static ArrayChunk from_values(Shape shape,
                                  const std::vector<T>& values,
                                  bool fortran_order = false);

    const Shape& shape() const noexcept { return shape_; }
    const DataType& dtype() const noexcept { return dtype_; }
    bool fortran_order() const noexcept { return fortran_order_; }

    size_t ndims() const noexcept { return shape_.size(); }
    size_t size() const noexcept;
    size_t nbytes() const noexcept { return data_.size(); }

    std::span<std::byte> bytes() noexcept { return data_; }
    std::span<const std::byte> bytes() const noexcept { return data_; }

    template<typename T>
    T* data()
    {
        return reinterpret_cast<T*>(data_.data());
    }

    template<typename T>
    const T* data() const
    {
        return reinterpret_cast<const T*>(data_.data());
    }

    /// Byte strides per dimension for the chunk's memory order.
    std::vector<size_t> strides() const;

    /**
     * @brief Copy out a sub-block, in C order.
     * @throw BadChunk if @p slices is not a valid in-bounds unit-step
     * selection of this array.
     */
    ArrayChunk slice(const SliceSpec& slices) const;

    /// Element-wise comparison; memory order does not matter.
    bool operator==(const ArrayChunk& other) const;

  private:
    Shape shape_;
    DataType dtype_;
    bool fortran_order_{ false };
    std::vector<std::byte> data_;
};

struct ChunkMetadata
{
    std::string chunk_name;
    Shape shape;
};

/**
 * @brief A store of chunks (i.e. N-dimensional arrays).
 *
 * The full identifier of a chunk (its "chunk name") is
 * "<array name>/<index string>", where the index string holds the chunk's
 * start offset along each dimension, e.g. "00001_00512".
 */
class ChunkStore
{
  public:
    /// One row of the translation table from transport faults to errors.
    struct ErrorRule
    {
        std::function<bool(TransportFault)> matches;
        ErrorKind kind;
    };
    using ErrorMap = std::vector<ErrorRule>;

    virtual ~ChunkStore() = default;

    /**
     * @brief Get a chunk from the store.
     * @param array_name The name of the parent array.
     * @param slices The chunk's position in the parent array.
     * @param dtype The expected data type of the chunk.
     * @return The chunk.
     * @throw ChunkNotFound if the chunk is missing.
     * @throw BadChunk if the stored chunk differs from the expected dtype
     * and/or shape, or the slices are malformed.
     * @throw StoreUnavailable if the store could not be reached.
     */
    virtual ArrayChunk get_chunk(std::string_view array_name,
                                 const SliceSpec& slices,
                                 const DataType& dtype) = 0;

    /**
     * @brief Put a chunk into the store.
     * @throw BadChunk if the chunk does not match @p slices.
     * @throw StoreUnavailable if the store could not be reached.
     */
    virtual void put_chunk(std::string_view array_name,
                           const SliceSpec& slices,
                           const ArrayChunk& chunk) = 0;

    /// True if the chunk is in the store.
    virtual bool has_chunk(std::string_view array_name,
                           const SliceSpec& slices,
                           const DataType& dtype);

    /// Index strings of all chunks of the array currently in the store.
    virtual std::vector<std::string> list_chunk_ids(
      std::string_view array_name) = 0;

    /// Make room for a new array. Creating an existing array is not an error.
    virtual void create_array(std::string_view array_name);

    /// Signal that all chunks of the array have been written.
    virtual void mark_complete(std::string_view array_name) = 0;

    /// True if mark_complete() has been called on the array.
    virtual bool is_complete(std::string_view array_name) = 0;

    /**
     * @brief Validate the slices of a chunk and derive the chunk name.
     * @return The chunk name and the shape implied by @p slices.
     * @throw BadChunk if a slice is open or has a non-unit step, or if the
     * dtype holds objects.
     */
    static ChunkMetadata chunk_metadata(std::string_view array_name,
                                        const SliceSpec& slices,
                                        const DataType& dtype);

    /**
     * @brief As above, additionally checking that @p chunk has the shape
     * implied by @p slices.
     */
    static ChunkMetadata chunk_metadata(std::string_view array_name,
                                        const SliceSpec& slices,
                                        const ArrayChunk& chunk);

    /// Split @p name on "/" at most @p maxsplit times.
    static std::vector<std::string> split(std::string_view name,
                                          size_t maxsplit);

    static std::string join(std::initializer_list<std::string_view> names);

  protected:
    explicit ChunkStore(ErrorMap error_map = {});

    /**
     * @brief Run @p op, translating transport faults into ChunkStoreError
     * types according to the error map. ChunkStoreErrors pass through.
     */
    template<typename Op>
    auto standard_errors(std::string_view chunk_name, Op&& op) -> decltype(op())
    {
        try {
            return op();
        } catch (const TransportError& exc) {
            translate_error_(chunk_name, exc);
        }
    }

  private:
    ErrorMap error_map_;

    [[noreturn]] void translate_error_(std::string_view chunk_name,
                                       const TransportError& exc) const;
};

/**
 * @brief Partition an array into chunks no larger than a byte budget.
 *
 * Dimensions are split in order, each into as few and as equal chunks as the
 * budget allows, until the chunk size fits.
 *
 * @param shape The shape of the array.
 * @param dtype The data type of the array.
 * @param max_chunk_size The byte budget per chunk.
 * @param dims_to_split Dimensions that may be split (all if unset). Indices
 * beyond the array rank are ignored.
 * @param power_of_two Restrict split dimensions to power-of-two chunk lengths.
 * @param max_dim_elements Upper bound on the chunk length along a dimension,
 * as (dimension, length) pairs, regardless of the byte budget.
 * @throw std::invalid_argument if @p max_chunk_size is not positive or a
 * dimension to split is empty.
 */
ChunkPartition
generate_chunks(const Shape& shape,
                const DataType& dtype,
                double max_chunk_size,
                const std::optional<std::set<size_t>>& dims_to_split = {},
                bool power_of_two = false,
                const std::vector<std::pair<size_t, size_t>>&
                  max_dim_elements = {});

/// The slice specification of every chunk in @p partition, in C order.
std::vector<SliceSpec>
chunk_slices(const ChunkPartition& partition);

struct S3ChunkStoreSettings
{
    std::string url; ///< e.g. "http://127.0.0.1:9000"
    double timeout_s{ 10.0 }; ///< per request; <= 0 waits indefinitely
    std::string token; ///< bearer token, exclusive with the static keys
    std::string access_key;
    std::string secret_key;
    bool public_read{ false }; ///< grant anonymous read on created buckets
    unsigned int expiry_days{ 0 }; ///< object expiry on created buckets
    size_t list_max_keys{ 100000 };
    unsigned int max_retries{ 2 }; ///< retries on connection failure
};

/**
 * @brief Connect to an S3-compatible object store.
 * @throw StoreUnavailable if the settings are invalid or the store is
 * unreachable.
 * @throw AuthorisationFailed if the credentials are rejected.
 */
std::unique_ptr<ChunkStore>
open_s3_chunk_store(const S3ChunkStoreSettings& settings);

// template definitions

template<typename T>
DataType
DataType::of()
{
    constexpr char native = std::endian::native == std::endian::little ? '<'
                                                                        : '>';
    if constexpr (std::is_same_v<T, bool>) {
        return { '|', 'b', 1 };
    } else if constexpr (std::is_same_v<T, std::complex<float>> ||
                         std::is_same_v<T, std::complex<double>>) {
        return { native, 'c', sizeof(T) };
    } else if constexpr (std::is_floating_point_v<T>) {
        return { native, 'f', sizeof(T) };
    } else if constexpr (std::is_integral_v<T>) {
        const char kind = std::is_signed_v<T> ? 'i' : 'u';
        return { sizeof(T) == 1 ? '|' : native, kind, sizeof(T) };
    } else {
        static_assert(sizeof(T) == 0, "Unsupported element type");
    }
}

template<typename T>
ArrayChunk
ArrayChunk::from_values(Shape shape,
                        const std::vector<T>& values,
                        bool fortran_order)
{
    ArrayChunk chunk(std::move(shape), DataType::of<T>(), fortran_order);
    if (chunk.size() != values.size()) {
        throw BadChunk("Expected " + std::to_string(chunk.size()) +
                       " values, got " + std::to_string(values.size()));
    }
    std::copy(values.begin(), values.end(), chunk.data<T>());
    return chunk;
}
} // namespace chunkstore

#endif // H_CHUNKSTORE_V0
