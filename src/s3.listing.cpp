#include "s3.listing.hh"
#include "chunkstore.hh"
#include "macros.hh"

#include <tinyxml2.h>

namespace {
[[noreturn]] void
malformed(const std::string& what)
{
    const std::string err = LOG_ERROR("Malformed bucket listing: ", what);
    throw chunkstore::TransportError(
      chunkstore::TransportFault::MalformedResponse, err);
}
} // namespace

chunkstore::ListBucketPage
chunkstore::parse_list_bucket_result(std::string_view xml)
{
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        malformed(doc.ErrorStr());
    }

    const auto* root = doc.FirstChildElement("ListBucketResult");
    if (root == nullptr) {
        malformed("no ListBucketResult element");
    }

    ListBucketPage page;

    if (const auto* truncated = root->FirstChildElement("IsTruncated")) {
        const char* text = truncated->GetText();
        page.is_truncated = text && std::string_view(text) == "true";
    }

    if (const auto* marker = root->FirstChildElement("NextMarker");
        marker && marker->GetText()) {
        page.next_marker = marker->GetText();
    }

    for (const auto* contents = root->FirstChildElement("Contents");
         contents != nullptr;
         contents = contents->NextSiblingElement("Contents")) {
        const auto* key = contents->FirstChildElement("Key");
        if (key == nullptr || key->GetText() == nullptr) {
            malformed("Contents without a Key");
        }
        page.keys.emplace_back(key->GetText());
    }

    return page;
}
