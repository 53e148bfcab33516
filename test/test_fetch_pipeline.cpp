#include <gtest/gtest.h>

#include "solrfetch/errors.hpp"
#include "solrfetch/fetch_pipeline.hpp"
#include "solrfetch/replication_urls.hpp"

#include "fake_http_client.hpp"
#include "temp_directory.hpp"

#include <fstream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

namespace solrfetch
{
    namespace
    {
        const std::string server = "http://localhost:8983/solr";

        // Serves generation 13 of a small index.
        class PipelineTest : public ::testing::Test
        {
        protected:
            PipelineTest()
                : urls(server)
            {
                const IndexIdentity identity{server, "1401508582278", "13"};
                client.respond(urls.versionUrl(),
                               test::versionResponse("0", identity.version, identity.generation));
                std::vector<std::string> names;
                for (const auto& [name, content] : files)
                {
                    names.push_back(name);
                    client.respond(urls.fileContentUrl(identity, name), content);
                }
                client.respond(urls.fileListUrl(identity), test::fileListResponse(names));
            }

            FetchConfig config(std::size_t workers) const
            {
                FetchConfig config;
                config.server_url = server;
                config.output_dir = dir.path();
                config.worker_count = workers;
                config.buffer_size = 1024;
                return config;
            }

            const std::map<std::string, std::string> files = {
                {"segments_d", std::string(300, '\x01')},
                {"_8.fdt", std::string(70000, 'f')},
                {"_8.fdx", "index"},
                {"_8.fnm", std::string(2048, 'n')},
                {"_8.si", ""},
            };

            test::TempDirectory dir;
            test::FakeHttpClient client;
            ReplicationUrls urls;
        };
    }

    TEST_F(PipelineTest, downloads_every_file_of_the_generation)
    {
        FetchPipeline pipeline(client, config(2));
        const FetchReport report = pipeline.run();

        EXPECT_EQ(report.identity.version, "1401508582278");
        EXPECT_EQ(report.identity.generation, "13");
        ASSERT_EQ(report.outcomes.size(), files.size());
        EXPECT_EQ(report.failed_status_count, 0u);

        std::set<std::string> fetched;
        std::uint64_t total = 0;
        for (const auto& outcome : report.outcomes)
        {
            EXPECT_EQ(outcome.status_code, 200);
            fetched.insert(outcome.file_name);
            total += outcome.bytes_written;
        }
        EXPECT_EQ(fetched.size(), files.size());
        EXPECT_EQ(report.total_bytes, total);

        for (const auto& [name, content] : files)
        {
            EXPECT_EQ(test::readFile(dir.path() / name), content) << name;
        }
    }

    TEST_F(PipelineTest, second_run_overwrites_with_identical_bytes)
    {
        FetchPipeline(client, config(3)).run();
        std::map<std::string, std::string> first;
        for (const auto& [name, content] : files)
        {
            first[name] = test::readFile(dir.path() / name);
        }

        // Stale, longer leftovers must be truncated, not appended to.
        for (const auto& [name, content] : files)
        {
            std::ofstream(dir.path() / name, std::ios::binary) << std::string(100000, '?');
        }

        FetchPipeline(client, config(1)).run();
        for (const auto& [name, content] : files)
        {
            EXPECT_EQ(test::readFile(dir.path() / name), first[name]) << name;
        }
    }

    TEST_F(PipelineTest, failed_version_status_fetches_nothing)
    {
        client.respond(urls.versionUrl(), test::versionResponse("1", "1401508582278", "13"));

        FetchPipeline pipeline(client, config(2));
        EXPECT_THROW(pipeline.run(), ProtocolStatusError);
        EXPECT_EQ(client.requests().size(), 1u);
    }

    TEST_F(PipelineTest, download_failure_fails_the_run)
    {
        const IndexIdentity identity{server, "1401508582278", "13"};
        client.failOn(urls.fileContentUrl(identity, "_8.fdx"));

        FetchPipeline pipeline(client, config(1));
        EXPECT_THROW(pipeline.run(), TransportError);
    }

    TEST_F(PipelineTest, malformed_server_url)
    {
        FetchConfig bad = config(1);
        bad.server_url = "http://[::1";

        FetchPipeline pipeline(client, bad);
        EXPECT_THROW(pipeline.run(), UrlParseError);
        EXPECT_TRUE(client.requests().empty());
    }

    TEST_F(PipelineTest, custom_failure_handler_skips_broken_file)
    {
        const IndexIdentity identity{server, "1401508582278", "13"};
        client.failOn(urls.fileContentUrl(identity, "_8.fnm"));

        FetchPipeline pipeline(client, config(2));
        pipeline.setFailureHandler([](const DownloadJob&, const FetchError&) {
            return FailureAction::Skip;
        });
        const FetchReport report = pipeline.run();
        EXPECT_EQ(report.outcomes.size(), files.size() - 1);
    }

    TEST_F(PipelineTest, failing_outcome_handler_stops_the_run)
    {
        std::size_t seen = 0;
        FetchPipeline pipeline(client, config(1));
        pipeline.setOutcomeHandler([&seen](const DownloadOutcome&) {
            ++seen;
            throw std::runtime_error("outcome store unavailable");
        });

        EXPECT_THROW(pipeline.run(), std::runtime_error);
        EXPECT_EQ(seen, 1u);
    }

    TEST_F(PipelineTest, outcome_handler_sees_every_outcome)
    {
        std::set<std::string> seen;
        FetchPipeline pipeline(client, config(2));
        pipeline.setOutcomeHandler([&seen](const DownloadOutcome& outcome) {
            seen.insert(outcome.file_name);
        });

        pipeline.run();
        EXPECT_EQ(seen.size(), files.size());
    }
}
