#include "npy.codec.hh"
#include "macros.hh"

#include <cctype>
#include <charconv>
#include <cstring>
#include <limits>

namespace {
constexpr std::string_view npy_magic = "\x93NUMPY";
constexpr size_t array_align = 64;

size_t
prelude_size(uint8_t major_version)
{
    // magic, version and the little-endian header length
    return npy_magic.size() + 2 + (major_version == 1 ? 2 : 4);
}

class DictParser
{
  public:
    explicit DictParser(std::string_view text)
      : text_{ text }
    {
    }

    chunkstore::NpyHeader parse()
    {
        chunkstore::NpyHeader header;
        bool has_descr = false, has_order = false, has_shape = false;

        expect_('{');
        while (true) {
            skip_ws_();
            if (peek_() == '}') {
                ++pos_;
                break;
            }

            const auto key = parse_string_();
            skip_ws_();
            expect_(':');
            skip_ws_();

            if (key == "descr") {
                EXPECT_GOOD_CHUNK(peek_() != '[',
                                  "Structured dtypes are not supported");
                header.dtype = chunkstore::DataType::from_descr(parse_string_());
                EXPECT_GOOD_CHUNK(!header.dtype.is_object(),
                                  "Object arrays cannot be loaded");
                has_descr = true;
            } else if (key == "fortran_order") {
                header.fortran_order = parse_bool_();
                has_order = true;
            } else if (key == "shape") {
                header.shape = parse_shape_();
                has_shape = true;
            } else {
                EXPECT_GOOD_CHUNK(false, "Unexpected key in NPY header: ", key);
            }

            skip_ws_();
            if (peek_() == ',') {
                ++pos_;
            } else {
                expect_('}');
                break;
            }
        }

        EXPECT_GOOD_CHUNK(has_descr && has_order && has_shape,
                          "NPY header lacks descr, fortran_order or shape");
        return header;
    }

  private:
    std::string_view text_;
    size_t pos_{ 0 };

    char peek_() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    void skip_ws_()
    {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    void expect_(char c)
    {
        skip_ws_();
        EXPECT_GOOD_CHUNK(
          peek_() == c, "Malformed NPY header: expected '", c, "' at ", pos_);
        ++pos_;
    }

    std::string parse_string_()
    {
        const char quote = peek_();
        EXPECT_GOOD_CHUNK(quote == '\'' || quote == '"',
                          "Malformed NPY header: expected a string at ",
                          pos_);
        const auto end = text_.find(quote, pos_ + 1);
        EXPECT_GOOD_CHUNK(end != std::string_view::npos,
                          "Malformed NPY header: unterminated string");
        std::string value(text_.substr(pos_ + 1, end - pos_ - 1));
        pos_ = end + 1;
        return value;
    }

    bool parse_bool_()
    {
        if (text_.substr(pos_, 4) == "True") {
            pos_ += 4;
            return true;
        }
        if (text_.substr(pos_, 5) == "False") {
            pos_ += 5;
            return false;
        }
        EXPECT_GOOD_CHUNK(false, "Malformed NPY header: expected a boolean");
        return false;
    }

    chunkstore::Shape parse_shape_()
    {
        chunkstore::Shape shape;
        expect_('(');
        while (true) {
            skip_ws_();
            if (peek_() == ')') {
                ++pos_;
                break;
            }

            size_t extent = 0;
            auto [end, ec] = std::from_chars(
              text_.data() + pos_, text_.data() + text_.size(), extent);
            EXPECT_GOOD_CHUNK(ec == std::errc{},
                              "Malformed NPY header: bad shape entry at ",
                              pos_);
            pos_ = static_cast<size_t>(end - text_.data());
            if (peek_() == 'L') { // Python 2 long
                ++pos_;
            }
            shape.push_back(extent);

            skip_ws_();
            if (peek_() == ',') {
                ++pos_;
            } else {
                expect_(')');
                break;
            }
        }
        return shape;
    }
};

template<typename T>
T
read_le(const char* p)
{
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<unsigned char>(p[i])) << (8 * i);
    }
    return value;
}
} // namespace

std::string
chunkstore::format_shape(const Shape& shape)
{
    std::string out = "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(shape[i]);
    }
    if (shape.size() == 1) {
        out += ",";
    }
    return out + ")";
}

chunkstore::ByteSegments
chunkstore::EncodedChunk::segments() const
{
    return { std::as_bytes(std::span(header.data(), header.size())), data };
}

std::string
chunkstore::encode_npy_header(const NpyHeader& header)
{
    std::string dict = "{'descr': '" + header.dtype.descr() +
                       "', 'fortran_order': " +
                       (header.fortran_order ? "True" : "False") +
                       ", 'shape': " + format_shape(header.shape) + ", }";

    uint8_t major = 1;
    auto total = prelude_size(major) + dict.size() + 1; // +1 for '\n'
    if (total + array_align > std::numeric_limits<uint16_t>::max()) {
        major = 2;
        total = prelude_size(major) + dict.size() + 1;
    }
    const size_t padding = (array_align - total % array_align) % array_align;
    dict.append(padding, ' ');
    dict += '\n';

    std::string out(npy_magic);
    out += static_cast<char>(major);
    out += static_cast<char>(0);

    const auto dict_len = static_cast<uint32_t>(dict.size());
    const size_t len_bytes = major == 1 ? 2 : 4;
    for (size_t i = 0; i < len_bytes; ++i) {
        out += static_cast<char>((dict_len >> (8 * i)) & 0xff);
    }

    return out + dict;
}

chunkstore::NpyHeader
chunkstore::parse_npy_header_dict(std::string_view dict)
{
    return DictParser(dict).parse();
}

chunkstore::EncodedChunk
chunkstore::encode_chunk(const ArrayChunk& chunk)
{
    EXPECT_GOOD_CHUNK(!chunk.dtype().is_object(),
                      "Object arrays cannot be saved");

    NpyHeader header;
    header.dtype = chunk.dtype();
    header.fortran_order = chunk.fortran_order() && chunk.ndims() > 1;
    header.shape = chunk.shape();

    EncodedChunk encoded;
    encoded.header = encode_npy_header(header);
    encoded.data = chunk.bytes();
    encoded.md5 = content_md5(encoded.segments());

    return encoded;
}

bool
chunkstore::NpyReader::consume(std::span<const std::byte> data) noexcept
{
    if (failed()) {
        return false;
    }

    try {
        consume_(data);
    } catch (const std::exception& exc) {
        error_ = exc.what();
    }

    return !failed();
}

void
chunkstore::NpyReader::consume_(std::span<const std::byte> data)
{
    constexpr size_t magic_and_version = npy_magic.size() + 2;

    while (!chunk_ && !data.empty()) {
        // grow the header buffer only as far as the header reaches
        size_t wanted = header_size_;
        if (!wanted) {
            wanted = header_buffer_.size() < magic_and_version
                       ? magic_and_version
                       : prelude_size(static_cast<uint8_t>(header_buffer_[6]));
        }

        const auto n = std::min(wanted - header_buffer_.size(), data.size());
        header_buffer_.append(reinterpret_cast<const char*>(data.data()), n);
        data = data.subspan(n);

        if (header_buffer_.size() < wanted) {
            break;
        }
        if (wanted == magic_and_version) {
            check_version_();
        } else if (!header_size_) {
            const char* len_field = header_buffer_.data() + magic_and_version;
            const size_t dict_len = header_buffer_[6] == 1
                                      ? read_le<uint16_t>(len_field)
                                      : read_le<uint32_t>(len_field);
            header_size_ = wanted + dict_len;
        } else {
            parse_header_();
        }
    }

    if (!chunk_ || data.empty()) {
        return;
    }

    auto dest = chunk_->bytes();
    EXPECT_GOOD_CHUNK(data.size() <= dest.size() - nbytes_received_,
                      "Payload holds more than the ",
                      dest.size(),
                      " data bytes its header declares");

    std::memcpy(dest.data() + nbytes_received_, data.data(), data.size());
    nbytes_received_ += data.size();
}

void
chunkstore::NpyReader::check_version_() const
{
    EXPECT_GOOD_CHUNK(
      std::string_view(header_buffer_).substr(0, npy_magic.size()) == npy_magic,
      "Payload is not in NPY format (bad magic string)");

    const auto major = static_cast<uint8_t>(header_buffer_[6]);
    const auto minor = static_cast<uint8_t>(header_buffer_[7]);
    EXPECT_GOOD_CHUNK((major == 1 || major == 2 || major == 3) && minor == 0,
                      "Unsupported NPY format version ",
                      static_cast<int>(major),
                      ".",
                      static_cast<int>(minor));
}

void
chunkstore::NpyReader::parse_header_()
{
    const auto prelude = prelude_size(static_cast<uint8_t>(header_buffer_[6]));
    auto header = parse_npy_header_dict(
      std::string_view(header_buffer_).substr(prelude));

    chunk_.emplace(std::move(header.shape), header.dtype, header.fortran_order);
}

chunkstore::ArrayChunk
chunkstore::NpyReader::finish()
{
    EXPECT_GOOD_CHUNK(!failed(), error_);
    EXPECT_GOOD_CHUNK(chunk_.has_value(),
                      "Payload ended inside the NPY header (",
                      header_buffer_.size(),
                      " bytes received)");
    EXPECT_GOOD_CHUNK(nbytes_received_ == chunk_->nbytes(),
                      "Payload holds ",
                      nbytes_received_,
                      " data bytes but its header declares ",
                      chunk_->nbytes());

    ArrayChunk chunk = std::move(*chunk_);
    chunk_.reset();
    return chunk;
}

chunkstore::ArrayChunk
chunkstore::decode_chunk(std::span<const std::byte> payload)
{
    NpyReader reader;
    reader.consume(payload);
    return reader.finish();
}
