#include "chunkstore.hh"
#include "macros.hh"

#include <cmath>
#include <map>
#include <stdexcept>

namespace {
size_t
largest_power_of_two_not_above(size_t n)
{
    return n == 0 ? 1 : std::bit_floor(n);
}

/// Split @p extent into @p n blocks whose lengths differ by at most one.
std::vector<size_t>
even_blocks(size_t extent, size_t n)
{
    std::vector<size_t> blocks(n, extent / n);
    for (size_t i = 0; i < extent % n; ++i) {
        ++blocks[i];
    }
    return blocks;
}

/// Blocks of length @p block, with a shorter remainder block at the end.
std::vector<size_t>
fixed_blocks(size_t extent, size_t block)
{
    std::vector<size_t> blocks(extent / block, block);
    if (extent % block) {
        blocks.push_back(extent % block);
    }
    return blocks;
}

size_t
ceil_div(size_t a, size_t b)
{
    return (a + b - 1) / b;
}
} // namespace

chunkstore::ChunkPartition
chunkstore::generate_chunks(
  const Shape& shape,
  const DataType& dtype,
  double max_chunk_size,
  const std::optional<std::set<size_t>>& dims_to_split,
  bool power_of_two,
  const std::vector<std::pair<size_t, size_t>>& max_dim_elements)
{
    if (!(max_chunk_size > 0)) {
        throw std::invalid_argument(
          LOG_ERROR("Chunk size budget must be positive, got ", max_chunk_size));
    }

    const auto ndims = shape.size();
    auto splittable = [&dims_to_split](size_t dim) {
        return !dims_to_split || dims_to_split->contains(dim);
    };

    for (size_t dim = 0; dim < ndims; ++dim) {
        if (splittable(dim) && shape[dim] == 0) {
            throw std::invalid_argument(LOG_ERROR(
              "Cannot split dimension ", dim, " with zero extent"));
        }
    }

    // chunk length along each dimension; under power_of_two the length is
    // fixed and the final block may be short, otherwise the chunk count is
    // fixed and the blocks are as even as possible
    std::vector<size_t> n_chunks(ndims, 1);
    std::vector<size_t> block(shape.begin(), shape.end());
    std::vector<bool> fixed_length(ndims, false);

    for (const auto& [dim, max_elements] : max_dim_elements) {
        if (dim >= ndims || max_elements == 0 || shape[dim] <= max_elements) {
            continue;
        }
        if (power_of_two) {
            block[dim] = largest_power_of_two_not_above(max_elements);
            n_chunks[dim] = ceil_div(shape[dim], block[dim]);
            fixed_length[dim] = true;
        } else {
            n_chunks[dim] = ceil_div(shape[dim], max_elements);
            block[dim] = ceil_div(shape[dim], n_chunks[dim]);
        }
    }

    auto chunk_bytes_without = [&](size_t skip) {
        double nbytes = static_cast<double>(dtype.itemsize);
        for (size_t dim = 0; dim < ndims; ++dim) {
            if (dim != skip) {
                nbytes *= static_cast<double>(block[dim]);
            }
        }
        return nbytes;
    };

    for (size_t dim = 0; dim < ndims; ++dim) {
        if (!splittable(dim)) {
            continue;
        }

        const double other_bytes = chunk_bytes_without(dim);
        if (other_bytes * static_cast<double>(block[dim]) <= max_chunk_size) {
            break;
        }

        if (power_of_two) {
            const auto allowed = static_cast<size_t>(
              std::floor(max_chunk_size / std::max(other_bytes, 1.0)));
            block[dim] = largest_power_of_two_not_above(
              std::min(std::max(allowed, size_t{ 1 }), block[dim]));
            n_chunks[dim] = ceil_div(shape[dim], block[dim]);
            fixed_length[dim] = true;
            continue;
        }

        auto n = static_cast<size_t>(std::ceil(
          other_bytes * static_cast<double>(shape[dim]) / max_chunk_size));
        n = std::clamp(n, n_chunks[dim], shape[dim]);
        while (n < shape[dim] && other_bytes * static_cast<double>(
                                                 ceil_div(shape[dim], n)) >
                                   max_chunk_size) {
            ++n;
        }
        n_chunks[dim] = n;
        block[dim] = ceil_div(shape[dim], n);
    }

    ChunkPartition partition;
    partition.reserve(ndims);
    for (size_t dim = 0; dim < ndims; ++dim) {
        if (fixed_length[dim]) {
            partition.push_back(fixed_blocks(shape[dim], block[dim]));
        } else {
            partition.push_back(even_blocks(shape[dim], n_chunks[dim]));
        }
    }

    return partition;
}

std::vector<chunkstore::SliceSpec>
chunkstore::chunk_slices(const ChunkPartition& partition)
{
    std::vector<SliceSpec> all_slices;

    // start offsets of each block, per dimension
    std::vector<std::vector<int64_t>> starts(partition.size());
    for (size_t dim = 0; dim < partition.size(); ++dim) {
        int64_t offset = 0;
        for (const auto length : partition[dim]) {
            starts[dim].push_back(offset);
            offset += static_cast<int64_t>(length);
        }
        if (partition[dim].empty()) {
            return all_slices;
        }
    }

    std::vector<size_t> index(partition.size(), 0);
    while (true) {
        SliceSpec slices;
        for (size_t dim = 0; dim < partition.size(); ++dim) {
            const auto start = starts[dim][index[dim]];
            slices.emplace_back(
              start, start + static_cast<int64_t>(partition[dim][index[dim]]));
        }
        all_slices.push_back(std::move(slices));

        size_t dim = partition.size();
        while (dim > 0) {
            --dim;
            if (++index[dim] < partition[dim].size()) {
                break;
            }
            index[dim] = 0;
            if (dim == 0) {
                return all_slices;
            }
        }
        if (partition.empty()) {
            return all_slices;
        }
    }
}
