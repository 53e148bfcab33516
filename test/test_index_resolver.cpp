#include <gtest/gtest.h>

#include "solrfetch/errors.hpp"
#include "solrfetch/index_resolver.hpp"
#include "solrfetch/replication_urls.hpp"

#include "fake_http_client.hpp"

namespace solrfetch
{
    namespace
    {
        const std::string server = "http://localhost:8983/solr";
        const IndexIdentity current{server, "1401508582278", "13"};
    }

    TEST(IndexResolver, resolves_identity_and_files)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(), test::versionResponse("0", "1401508582278", "13"));
        client.respond(urls.fileListUrl(current), test::fileListResponse({"segments_d", "_8.fdt"}));

        IndexResolver resolver(client);
        const ResolvedIndex index = resolver.resolve(urls);

        EXPECT_EQ(index.identity.base_url, server);
        EXPECT_EQ(index.identity.version, "1401508582278");
        EXPECT_EQ(index.identity.generation, "13");
        ASSERT_EQ(index.files.size(), 2u);
        EXPECT_EQ(index.files[0].name, "segments_d");
        EXPECT_EQ(index.files[1].name, "_8.fdt");

        const std::vector<std::string> expected = {urls.versionUrl(), urls.fileListUrl(current)};
        EXPECT_EQ(client.requests(), expected);
    }

    TEST(IndexResolver, ignores_groups_other_than_filelist)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(), test::versionResponse("0", "1401508582278", "13"));
        client.respond(urls.fileListUrl(current), R"(<response>
            <lst name="responseHeader"><int name="status">0</int></lst>
            <arr name="filelist">
              <lst><str name="name">segments_d</str><long name="size">1</long></lst>
              <lst><str name="name">_8.fdt</str><long name="size">2</long></lst>
            </arr>
            <arr name="other">
              <lst><str name="name">unrelated.txt</str><long name="size">3</long></lst>
            </arr>
        </response>)");

        IndexResolver resolver(client);
        const auto files = resolver.resolve(urls).files;
        ASSERT_EQ(files.size(), 2u);
        EXPECT_EQ(files[0].name, "segments_d");
        EXPECT_EQ(files[1].name, "_8.fdt");
    }

    TEST(IndexResolver, failed_version_status_stops_discovery)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(), test::versionResponse("1", "1401508582278", "13"));
        client.respond(urls.fileListUrl(current), test::fileListResponse({"segments_d"}));

        IndexResolver resolver(client);
        try
        {
            resolver.resolve(urls);
            FAIL() << "expected ProtocolStatusError";
        }
        catch (const ProtocolStatusError& error)
        {
            EXPECT_EQ(error.status(), "1");
            EXPECT_EQ(error.kind(), ErrorKind::ProtocolStatus);
        }
        EXPECT_FALSE(client.requested(urls.fileListUrl(current)));
    }

    TEST(IndexResolver, failed_file_list_status)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(), test::versionResponse("0", "1401508582278", "13"));
        client.respond(urls.fileListUrl(current), test::fileListResponse({"segments_d"}, "500"));

        IndexResolver resolver(client);
        EXPECT_THROW(resolver.resolve(urls), ProtocolStatusError);
    }

    TEST(IndexResolver, transport_failure)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.failOn(urls.versionUrl());

        IndexResolver resolver(client);
        EXPECT_THROW(resolver.resolve(urls), TransportError);
    }

    TEST(IndexResolver, error_page_is_a_transport_failure)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(), "<html><body>Service Unavailable</body>", 503);

        IndexResolver resolver(client);
        EXPECT_THROW(resolver.resolve(urls), TransportError);
    }

    TEST(IndexResolver, garbage_body_is_a_decode_failure)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(), "indexversion=1401508582278");

        IndexResolver resolver(client);
        EXPECT_THROW(resolver.resolve(urls), DecodeError);
    }

    TEST(IndexResolver, missing_generation)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(),
                       "<response><lst name=\"responseHeader\"><int name=\"status\">0</int></lst>"
                       "<long name=\"indexversion\">1401508582278</long></response>");

        IndexResolver resolver(client);
        EXPECT_THROW(resolver.resolve(urls), DecodeError);
    }

    TEST(IndexResolver, missing_filelist_group)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(), test::versionResponse("0", "1401508582278", "13"));
        client.respond(urls.fileListUrl(current),
                       "<response><lst name=\"responseHeader\"><int name=\"status\">0</int></lst>"
                       "<str name=\"status\">invalid index generation</str></response>");

        IndexResolver resolver(client);
        EXPECT_THROW(resolver.resolve(urls), DecodeError);
    }

    TEST(IndexResolver, empty_filelist_group)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(), test::versionResponse("0", "1401508582278", "13"));
        client.respond(urls.fileListUrl(current), test::fileListResponse({}));

        IndexResolver resolver(client);
        EXPECT_TRUE(resolver.resolve(urls).files.empty());
    }

    TEST(IndexResolver, rejects_file_names_outside_output_directory)
    {
        ReplicationUrls urls(server);
        test::FakeHttpClient client;
        client.respond(urls.versionUrl(), test::versionResponse("0", "1401508582278", "13"));
        client.respond(urls.fileListUrl(current), test::fileListResponse({"segments_d", "../passwd"}));

        IndexResolver resolver(client);
        EXPECT_THROW(resolver.resolve(urls), DecodeError);
    }
}
