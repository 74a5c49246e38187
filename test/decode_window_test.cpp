#include "decode_window.hpp"
#include "error.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace b64stream {
namespace {

    struct window_fixture
        : ::testing::Test
    {
        window_result decode(std::string const& tail,
                             bool ended,
                             std::size_t offset = 0,
                             bool best_effort = false)
        {
            tail_ = tail;
            auto run = raw_run(head, asio::buffer(tail_));
            return decode_window(run, offset, ended, best_effort, output, ec);
        }

        std::string decoded() const
        {
            return std::string(output.begin(), output.end());
        }

        leftover_group            head;
        std::vector<std::uint8_t> output;
        error_code                ec;

    private:
        std::string tail_;
    };

    TEST_F(window_fixture, decodes_all_complete_groups_and_leaves_the_rest)
    {
        auto result = decode("Zm9vYmFyYmF6Zm", false);
        EXPECT_FALSE(ec);
        EXPECT_EQ(window_status::decoded, result.status);
        EXPECT_EQ(3u, result.groups);
        EXPECT_FALSE(result.boundary);
        EXPECT_EQ("foobarbaz", decoded());
    }

    TEST_F(window_fixture, stops_after_the_first_padded_group)
    {
        auto result = decode("Zm8=YmFy", false);
        EXPECT_FALSE(ec);
        EXPECT_EQ(1u, result.groups);
        EXPECT_TRUE(result.boundary);
        EXPECT_EQ(2u, result.last_group_length);
        EXPECT_EQ("fo", decoded());
    }

    TEST_F(window_fixture, continues_from_an_offset)
    {
        auto result = decode("Zm8=YmFy", false, 4);
        EXPECT_FALSE(ec);
        EXPECT_EQ(1u, result.groups);
        EXPECT_FALSE(result.boundary);
        EXPECT_EQ("bar", decoded());
    }

    TEST_F(window_fixture, short_run_needs_more_data)
    {
        auto result = decode("Zm9", false);
        EXPECT_FALSE(ec);
        EXPECT_EQ(window_status::need_more_data, result.status);
        EXPECT_EQ(0u, result.groups);
        EXPECT_TRUE(output.empty());
    }

    TEST_F(window_fixture, short_run_at_end_of_stream_is_truncated)
    {
        decode("a", true);
        EXPECT_EQ(error_code(error::truncated_input), ec);
        EXPECT_EQ("Unexpected end of data when reading base64 content.", ec.message());
    }

    TEST_F(window_fixture, empty_run_at_end_of_stream_completes)
    {
        auto result = decode("", true);
        EXPECT_FALSE(ec);
        EXPECT_EQ(window_status::end_of_stream, result.status);
    }

    TEST_F(window_fixture, best_effort_ignores_truncation)
    {
        auto result = decode("Zm", true, 0, true);
        EXPECT_FALSE(ec);
        EXPECT_EQ(window_status::need_more_data, result.status);
    }

    TEST_F(window_fixture, leftover_group_is_prepended)
    {
        const std::uint8_t carried[] = { 'Z', 'm' };
        head.assign(carried, carried + 2);

        auto result = decode("9vYmFy", false);
        EXPECT_FALSE(ec);
        EXPECT_EQ(2u, result.groups);
        EXPECT_EQ("foobar", decoded());
    }

    TEST_F(window_fixture, invalid_group_reports_groups_before_it)
    {
        auto result = decode("Zm9vY*Fy", false);
        EXPECT_EQ(error_code(error::invalid_character), ec);
        EXPECT_EQ(1u, result.groups);
        EXPECT_EQ("foo", decoded());
    }

    TEST_F(window_fixture, padding_followed_by_data_in_a_group_is_invalid)
    {
        decode("Zm=v", true);
        EXPECT_EQ(error_code(error::invalid_character), ec);
    }

    TEST(leftover_group_test, holds_at_most_three_bytes)
    {
        leftover_group group;
        const std::uint8_t bytes[] = { 'a', 'b', 'c', 'd' };
        group.assign(bytes, bytes + 3);
        EXPECT_EQ(3u, group.size());
        EXPECT_EQ('c', group[2]);
        EXPECT_THROW(group.assign(bytes, bytes + 4), std::length_error);
        group.clear();
        EXPECT_TRUE(group.empty());
    }

}
}
