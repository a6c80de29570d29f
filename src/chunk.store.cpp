#include "chunkstore.hh"
#include "macros.hh"
#include "npy.codec.hh"

#include <cstdio>

namespace {
constexpr char name_separator = '/';

/// Validate @p slices and return the shape they select.
chunkstore::Shape
shape_of_slices(const chunkstore::SliceSpec& slices)
{
    chunkstore::Shape shape;
    shape.reserve(slices.size());

    for (size_t i = 0; i < slices.size(); ++i) {
        const auto& s = slices[i];
        EXPECT_GOOD_CHUNK(s.start.has_value() && s.stop.has_value(),
                          "Slice ",
                          i,
                          " needs an explicit start and stop");
        EXPECT_GOOD_CHUNK(
          s.step == 1, "Slice ", i, " has step ", s.step, " (only 1 allowed)");
        EXPECT_GOOD_CHUNK(*s.start >= 0 && *s.start <= *s.stop,
                          "Slice ",
                          i,
                          " has invalid range [",
                          *s.start,
                          ", ",
                          *s.stop,
                          ")");
        shape.push_back(static_cast<size_t>(*s.stop - *s.start));
    }

    return shape;
}

std::string
index_string(const chunkstore::SliceSpec& slices)
{
    std::string index;
    for (const auto& s : slices) {
        if (!index.empty()) {
            index += '_';
        }
        char buf[24];
        std::snprintf(
          buf, sizeof(buf), "%05lld", static_cast<long long>(*s.start));
        index += buf;
    }
    return index;
}
} // namespace

chunkstore::ChunkStore::ChunkStore(ErrorMap error_map)
  : error_map_{ std::move(error_map) }
{
}

bool
chunkstore::ChunkStore::has_chunk(std::string_view array_name,
                                  const SliceSpec& slices,
                                  const DataType& dtype)
{
    try {
        get_chunk(array_name, slices, dtype);
    } catch (const ChunkNotFound&) {
        return false;
    }
    return true;
}

void
chunkstore::ChunkStore::create_array(std::string_view)
{
}

chunkstore::ChunkMetadata
chunkstore::ChunkStore::chunk_metadata(std::string_view array_name,
                                       const SliceSpec& slices,
                                       const DataType& dtype)
{
    EXPECT_GOOD_CHUNK(!dtype.is_object(),
                      "Array '",
                      array_name,
                      "': object dtype ",
                      dtype.descr(),
                      " is not supported");

    Shape shape = shape_of_slices(slices);
    return { join({ array_name, index_string(slices) }), std::move(shape) };
}

chunkstore::ChunkMetadata
chunkstore::ChunkStore::chunk_metadata(std::string_view array_name,
                                       const SliceSpec& slices,
                                       const ArrayChunk& chunk)
{
    auto metadata = chunk_metadata(array_name, slices, chunk.dtype());
    EXPECT_GOOD_CHUNK(chunk.shape() == metadata.shape,
                      "Chunk ",
                      metadata.chunk_name,
                      ": shape ",
                      format_shape(chunk.shape()),
                      " differs from slice shape ",
                      format_shape(metadata.shape));
    return metadata;
}

std::vector<std::string>
chunkstore::ChunkStore::split(std::string_view name, size_t maxsplit)
{
    std::vector<std::string> parts;
    while (parts.size() < maxsplit) {
        const auto pos = name.find(name_separator);
        if (pos == std::string_view::npos) {
            break;
        }
        parts.emplace_back(name.substr(0, pos));
        name.remove_prefix(pos + 1);
    }
    parts.emplace_back(name);

    return parts;
}

std::string
chunkstore::ChunkStore::join(std::initializer_list<std::string_view> names)
{
    std::string joined;
    bool first = true;
    for (const auto& name : names) {
        if (!first) {
            joined += name_separator;
        }
        joined += name;
        first = false;
    }
    return joined;
}

void
chunkstore::ChunkStore::translate_error_(std::string_view chunk_name,
                                         const TransportError& exc) const
{
    std::string message = exc.what();
    if (!chunk_name.empty()) {
        message = "Chunk " + std::string(chunk_name) + ": " + message;
    }

    for (const auto& rule : error_map_) {
        if (rule.matches && rule.matches(exc.fault())) {
            raise_error(rule.kind, message);
        }
    }

    // nothing foreign leaves the store
    LOG_WARNING("Unclassified transport fault: ", message);
    raise_error(ErrorKind::StoreUnavailable, message);
}
