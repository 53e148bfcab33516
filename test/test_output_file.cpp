#include <gtest/gtest.h>

#include "solrfetch/errors.hpp"
#include "solrfetch/output_file.hpp"

#include "temp_directory.hpp"

#include <algorithm>
#include <string>

namespace solrfetch
{
    TEST(OutputFile, writes_through_fixed_buffer)
    {
        test::TempDirectory dir;
        const std::string payload(10000, 'x');

        OutputFile out(dir.path() / "_0.cfs", 1024);
        for (std::size_t offset = 0; offset < payload.size(); offset += 3000)
        {
            out.write(payload.data() + offset, std::min<std::size_t>(3000, payload.size() - offset));
        }
        out.close();

        EXPECT_EQ(out.bytesWritten(), payload.size());
        EXPECT_EQ(out.bufferCapacity(), 1024u);
        EXPECT_LE(out.peakBuffered(), 1024u);
        EXPECT_EQ(test::readFile(dir.path() / "_0.cfs"), payload);
    }

    TEST(OutputFile, buffer_does_not_grow_with_file_size)
    {
        test::TempDirectory dir;

        OutputFile small(dir.path() / "small", 4096);
        const std::string small_payload(100, 'a');
        small.write(small_payload.data(), small_payload.size());
        small.close();

        OutputFile large(dir.path() / "large", 4096);
        const std::string large_payload(1 << 20, 'b');
        large.write(large_payload.data(), large_payload.size());
        large.close();

        EXPECT_EQ(small.bufferCapacity(), large.bufferCapacity());
        EXPECT_LE(large.peakBuffered(), 4096u);
        EXPECT_EQ(large.bytesWritten(), large_payload.size());
    }

    TEST(OutputFile, truncates_existing_file)
    {
        test::TempDirectory dir;
        {
            OutputFile out(dir.path() / "segments_d", 16);
            const std::string first = "a much longer first version";
            out.write(first.data(), first.size());
            out.close();
        }
        {
            OutputFile out(dir.path() / "segments_d", 16);
            out.write("short", 5);
            out.close();
        }
        EXPECT_EQ(test::readFile(dir.path() / "segments_d"), "short");
    }

    TEST(OutputFile, unwritable_path)
    {
        test::TempDirectory dir;
        EXPECT_THROW(OutputFile(dir.path() / "missing" / "segments_d", 16), LocalIoError);
    }
}
