#include "s3.listing.hh"
#include "chunkstore.hh"
#include "unit.test.macros.hh"

using namespace chunkstore;

int
main()
{
    int retval = 1;

    try {
        auto page = parse_list_bucket_result(
          "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
          "<ListBucketResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
          "<Name>bucket</Name><Prefix>array</Prefix><Marker></Marker>"
          "<MaxKeys>2</MaxKeys><IsTruncated>true</IsTruncated>"
          "<NextMarker>array/00010.npy</NextMarker>"
          "<Contents><Key>array/00000.npy</Key><Size>136</Size></Contents>"
          "<Contents><Key>array/00010.npy</Key><Size>136</Size></Contents>"
          "</ListBucketResult>");
        EXPECT_EQ(int, page.keys.size(), 2);
        EXPECT_STR_EQ(page.keys[0], "array/00000.npy");
        EXPECT_STR_EQ(page.keys[1], "array/00010.npy");
        CHECK(page.is_truncated);
        EXPECT_STR_EQ(page.next_marker, "array/00010.npy");

        // NextMarker is optional, and so are the contents
        page = parse_list_bucket_result(
          "<ListBucketResult><IsTruncated>false</IsTruncated>"
          "</ListBucketResult>");
        CHECK(page.keys.empty());
        CHECK(!page.is_truncated);
        CHECK(page.next_marker.empty());

        EXPECT_THROW(TransportError, parse_list_bucket_result("<Oops"));
        EXPECT_THROW(TransportError, parse_list_bucket_result(""));
        EXPECT_THROW(TransportError,
                     parse_list_bucket_result("<Error><Code>X</Code></Error>"));
        EXPECT_THROW(TransportError,
                     parse_list_bucket_result(
                       "<ListBucketResult><Contents><Size>1</Size></Contents>"
                       "</ListBucketResult>"));

        try {
            parse_list_bucket_result("not xml at all");
            CHECK(false);
        } catch (const TransportError& exc) {
            CHECK(exc.fault() == TransportFault::MalformedResponse);
        }

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
