#include "npy.codec.hh"
#include "unit.test.macros.hh"

#include <numeric>

using namespace chunkstore;

namespace {
std::string
payload_of(const ArrayChunk& chunk)
{
    const auto encoded = encode_chunk(chunk);
    std::string payload = encoded.header;
    payload.append(reinterpret_cast<const char*>(encoded.data.data()),
                   encoded.data.size());
    return payload;
}

ArrayChunk
decode_in_pieces(const std::string& payload, size_t piece_size)
{
    const auto bytes = std::as_bytes(std::span(payload.data(), payload.size()));

    NpyReader reader;
    for (size_t offset = 0; offset < bytes.size(); offset += piece_size) {
        const auto n = std::min(piece_size, bytes.size() - offset);
        CHECK(reader.consume(bytes.subspan(offset, n)));
    }
    CHECK(!reader.failed());
    return reader.finish();
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        std::vector<double> values(96);
        std::iota(values.begin(), values.end(), 0.0);
        const auto y =
          ArrayChunk::from_values<double>({ 8, 6, 2 }, values)
            .slice({ { 3, 7 }, { 2, 5 }, { 1, 2 } });
        const auto payload = payload_of(y);

        for (size_t piece : { size_t{ 1 }, size_t{ 3 }, size_t{ 7 },
                              size_t{ 64 }, payload.size() }) {
            const auto decoded = decode_in_pieces(payload, piece);
            CHECK(decoded == y);
            CHECK(decoded.dtype() == y.dtype());
            CHECK(decoded.shape() == y.shape());
        }

        const auto whole = decode_chunk(
          std::as_bytes(std::span(payload.data(), payload.size())));
        CHECK(whole == y);

        // memory order survives the round trip
        const auto f_order =
          ArrayChunk::from_values<int32_t>({ 2, 3 }, { 1, 4, 2, 5, 3, 6 }, true);
        const auto decoded_f = decode_in_pieces(payload_of(f_order), 5);
        CHECK(decoded_f.fortran_order());
        CHECK(decoded_f ==
              ArrayChunk::from_values<int32_t>({ 2, 3 }, { 1, 2, 3, 4, 5, 6 }));

        // bool, zero-size and 0-d chunks
        const auto x = ArrayChunk::from_values<bool>({ 2 }, { true, true });
        CHECK(decode_in_pieces(payload_of(x), 2) == x);

        const ArrayChunk empty({ 3, 0, 2 }, DataType::of<double>());
        const auto empty_payload = payload_of(empty);
        EXPECT_EQ(int, empty_payload.size() % 64, 0);
        const auto decoded_empty = decode_in_pieces(empty_payload, 11);
        CHECK(decoded_empty.shape() == Shape({ 3, 0, 2 }));
        EXPECT_EQ(int, decoded_empty.nbytes(), 0);

        const auto z = ArrayChunk::from_values<double>({}, { 2.0 });
        const auto decoded_z = decode_in_pieces(payload_of(z), 1);
        CHECK(decoded_z.shape().empty());
        EXPECT_EQ(double, decoded_z.data<double>()[0], 2.0);

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
