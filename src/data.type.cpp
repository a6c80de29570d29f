#include "chunkstore.hh"
#include "macros.hh"

#include <bit>
#include <charconv>
#include <string_view>

namespace {
constexpr char native_order =
  std::endian::native == std::endian::little ? '<' : '>';

constexpr std::string_view known_kinds = "biufcmMOSUV";

// "U" descriptors count UCS-4 characters rather than bytes
constexpr size_t ucs4_size = 4;

bool
is_byte_order(char c)
{
    return c == '<' || c == '>' || c == '|' || c == '=';
}
} // namespace

chunkstore::DataType
chunkstore::DataType::from_descr(std::string_view descr)
{
    EXPECT_GOOD_CHUNK(!descr.empty(), "Empty dtype descriptor");

    DataType dtype;
    char order = '=';
    if (is_byte_order(descr.front())) {
        order = descr.front();
        descr.remove_prefix(1);
    }

    EXPECT_GOOD_CHUNK(!descr.empty() &&
                        known_kinds.find(descr.front()) != std::string::npos,
                      "Unknown dtype kind in descriptor '",
                      descr,
                      "'");
    dtype.kind = descr.front();
    descr.remove_prefix(1);

    size_t itemsize = 0;
    if (dtype.kind == 'b' && descr.empty()) {
        itemsize = 1;
    } else if (dtype.kind == 'O' && descr.empty()) {
        itemsize = sizeof(void*);
    } else {
        auto [end, ec] =
          std::from_chars(descr.data(), descr.data() + descr.size(), itemsize);
        EXPECT_GOOD_CHUNK(ec == std::errc{} && end == descr.data() + descr.size(),
                          "Invalid item size in dtype descriptor");
    }

    // datetime unit suffixes such as "<M8[ns]" are not supported
    EXPECT_GOOD_CHUNK(itemsize > 0, "Zero item size in dtype descriptor");
    dtype.itemsize = dtype.kind == 'U' ? itemsize * ucs4_size : itemsize;

    if (order == '=') {
        order = native_order;
    }
    if (itemsize <= 1 || dtype.kind == 'S' || dtype.kind == 'V' ||
        dtype.kind == 'O') {
        order = '|';
    }
    dtype.byte_order = order;

    return dtype;
}

std::string
chunkstore::DataType::descr() const
{
    std::string out;
    out += byte_order;
    out += kind;
    out += std::to_string(kind == 'U' ? itemsize / ucs4_size : itemsize);
    return out;
}

bool
chunkstore::DataType::operator==(const DataType& other) const noexcept
{
    return kind == other.kind && itemsize == other.itemsize &&
           byte_order == other.byte_order;
}
