#include "crypto.hh"
#include "macros.hh"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <memory>
#include <stdexcept>

std::string
chunkstore::content_md5(const ByteSegments& segments)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
      EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    CHECK(ctx);
    CHECK(EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) == 1);

    for (const auto& segment : segments) {
        if (!segment.empty()) {
            CHECK(EVP_DigestUpdate(ctx.get(), segment.data(), segment.size()) ==
                  1);
        }
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    CHECK(EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) == 1);

    return base64_encode(
      { reinterpret_cast<const char*>(digest), digest_len });
}

std::string
chunkstore::base64_encode(std::string_view data)
{
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int n = EVP_EncodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<const unsigned char*>(data.data()),
      static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

std::string
chunkstore::base64_decode(std::string_view data)
{
    while (!data.empty() && data.back() == '=') {
        data.remove_suffix(1);
    }
    if (data.size() % 4 == 1) {
        throw std::invalid_argument("Invalid base64 length");
    }

    std::string in(data);
    for (auto& c : in) {
        if (c == '-') {
            c = '+';
        } else if (c == '_') {
            c = '/';
        } else if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' &&
                   c != '/') {
            throw std::invalid_argument("Invalid base64 character");
        }
    }

    // EVP_DecodeBlock wants whole quads and decodes padding as zero bytes
    const size_t padding = (4 - in.size() % 4) % 4;
    in.append(padding, '=');

    std::string out(3 * in.size() / 4, '\0');
    const int n =
      EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                      reinterpret_cast<const unsigned char*>(in.data()),
                      static_cast<int>(in.size()));
    if (n < 0) {
        throw std::invalid_argument("Invalid base64 data");
    }
    out.resize(static_cast<size_t>(n) - padding);

    return out;
}

std::string
chunkstore::hmac_sha1(std::string_view key, std::string_view data)
{
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    const auto* digest =
      HMAC(EVP_sha1(),
           key.data(),
           static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char*>(data.data()),
           data.size(),
           result,
           &len);
    CHECK(digest != nullptr);

    return { reinterpret_cast<const char*>(result), len };
}
