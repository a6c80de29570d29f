#include "chunkstore.hh"
#include "macros.hh"

#include <cstring>
#include <functional>
#include <limits>
#include <numeric>

namespace {
size_t
product(const chunkstore::Shape& shape)
{
    return std::accumulate(
      shape.begin(), shape.end(), size_t{ 1 }, std::multiplies<>());
}

/// Call @p fn with every multi-index of @p shape, last index fastest.
template<typename Fn>
void
for_each_index(const chunkstore::Shape& shape, Fn&& fn)
{
    if (product(shape) == 0) {
        return;
    }

    std::vector<size_t> index(shape.size(), 0);
    while (true) {
        fn(index);

        size_t dim = shape.size();
        while (dim > 0) {
            --dim;
            if (++index[dim] < shape[dim]) {
                break;
            }
            index[dim] = 0;
            if (dim == 0) {
                return;
            }
        }
        if (shape.empty()) {
            return;
        }
    }
}

/// Byte length of a chunk, refusing shapes whose size does not fit.
size_t
checked_nbytes(const chunkstore::Shape& shape,
               size_t itemsize,
               size_t max_bytes)
{
    constexpr auto max = std::numeric_limits<size_t>::max();

    size_t count = 1;
    for (size_t i = 0; i < shape.size(); ++i) {
        const auto extent = shape[i];
        EXPECT_GOOD_CHUNK(extent == 0 || count <= max / extent,
                          "Element count overflows at dimension ",
                          i,
                          " (extent ",
                          extent,
                          ")");
        count *= extent;
    }
    EXPECT_GOOD_CHUNK(itemsize == 0 || count <= max_bytes / itemsize,
                      "Chunk of ",
                      count,
                      " elements of ",
                      itemsize,
                      " bytes exceeds the addressable size");

    return count * itemsize;
}

size_t
offset_of(const std::vector<size_t>& index, const std::vector<size_t>& strides)
{
    return std::inner_product(
      index.begin(), index.end(), strides.begin(), size_t{ 0 });
}
} // namespace

chunkstore::ArrayChunk::ArrayChunk(Shape shape,
                                   DataType dtype,
                                   bool fortran_order)
  : shape_{ std::move(shape) }
  , dtype_{ dtype }
  , fortran_order_{ fortran_order }
{
    EXPECT_GOOD_CHUNK(!dtype_.is_object(),
                      "Object arrays are not supported: ",
                      dtype_.descr());
    data_.resize(
      checked_nbytes(shape_, dtype_.itemsize, data_.max_size()));
}

size_t
chunkstore::ArrayChunk::size() const noexcept
{
    return product(shape_);
}

std::vector<size_t>
chunkstore::ArrayChunk::strides() const
{
    std::vector<size_t> strides(shape_.size(), dtype_.itemsize);
    if (shape_.empty()) {
        return strides;
    }

    if (fortran_order_) {
        for (size_t i = 1; i < shape_.size(); ++i) {
            strides[i] = strides[i - 1] * shape_[i - 1];
        }
    } else {
        for (size_t i = shape_.size() - 1; i > 0; --i) {
            strides[i - 1] = strides[i] * shape_[i];
        }
    }

    return strides;
}

chunkstore::ArrayChunk
chunkstore::ArrayChunk::slice(const SliceSpec& slices) const
{
    EXPECT_GOOD_CHUNK(slices.size() == shape_.size(),
                      "Expected ",
                      shape_.size(),
                      " slices, got ",
                      slices.size());

    Shape out_shape;
    std::vector<size_t> starts;
    for (size_t i = 0; i < slices.size(); ++i) {
        const auto& s = slices[i];
        EXPECT_GOOD_CHUNK(s.start && s.stop && s.step == 1,
                          "Slice ",
                          i,
                          " must have a start, a stop and unit step");
        EXPECT_GOOD_CHUNK(0 <= *s.start && *s.start <= *s.stop &&
                            static_cast<size_t>(*s.stop) <= shape_[i],
                          "Slice ",
                          i,
                          " [",
                          *s.start,
                          ", ",
                          *s.stop,
                          ") is out of bounds for extent ",
                          shape_[i]);
        starts.push_back(static_cast<size_t>(*s.start));
        out_shape.push_back(static_cast<size_t>(*s.stop - *s.start));
    }

    ArrayChunk out(out_shape, dtype_);
    const auto src_strides = strides();
    const auto dst_strides = out.strides();
    const auto itemsize = dtype_.itemsize;

    std::vector<size_t> src_index(starts.size());
    for_each_index(out_shape, [&](const std::vector<size_t>& index) {
        for (size_t i = 0; i < index.size(); ++i) {
            src_index[i] = starts[i] + index[i];
        }
        std::memcpy(out.data_.data() + offset_of(index, dst_strides),
                    data_.data() + offset_of(src_index, src_strides),
                    itemsize);
    });

    return out;
}

bool
chunkstore::ArrayChunk::operator==(const ArrayChunk& other) const
{
    if (shape_ != other.shape_ || !(dtype_ == other.dtype_)) {
        return false;
    }

    if (fortran_order_ == other.fortran_order_ || ndims() < 2) {
        return data_ == other.data_;
    }

    const auto lhs_strides = strides();
    const auto rhs_strides = other.strides();
    const auto itemsize = dtype_.itemsize;

    bool equal = true;
    for_each_index(shape_, [&](const std::vector<size_t>& index) {
        if (equal &&
            std::memcmp(data_.data() + offset_of(index, lhs_strides),
                        other.data_.data() + offset_of(index, rhs_strides),
                        itemsize) != 0) {
            equal = false;
        }
    });

    return equal;
}
