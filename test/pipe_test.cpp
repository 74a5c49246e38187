#include "pipe.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace b64stream {
namespace {

    using namespace test_support;

    struct pipe_fixture
        : ::testing::Test
    {
        asio::io_context ioc;
        b64stream::pipe  source { ioc.get_executor() };
        pipe_reader&     reader = source.reader();
    };

    TEST_F(pipe_fixture, read_waits_for_a_write)
    {
        auto read = start_read(reader);
        settle(ioc);
        EXPECT_FALSE(read->done);

        source.write("abc");
        settle(ioc);
        ASSERT_TRUE(read->done);
        EXPECT_FALSE(read->ec);
        EXPECT_EQ("abc", read->data());
        EXPECT_FALSE(read->result.is_completed);
        EXPECT_FALSE(read->result.is_canceled);
    }

    TEST_F(pipe_fixture, handler_is_never_called_inline)
    {
        source.write("abc");
        auto read = start_read(reader);
        EXPECT_FALSE(read->done);
        settle(ioc);
        EXPECT_TRUE(read->done);
    }

    TEST_F(pipe_fixture, unconsumed_bytes_are_presented_again)
    {
        source.write("hello");
        auto first = read_now(ioc, reader);
        reader.advance(2, 2);

        auto second = read_now(ioc, reader);
        EXPECT_EQ("llo", second.data());
        reader.advance(3);
        EXPECT_EQ(0u, source.buffered());
    }

    TEST_F(pipe_fixture, examined_bytes_wait_for_more_data)
    {
        source.write("hel");
        read_now(ioc, reader);
        reader.advance(0, 3);

        auto read = start_read(reader);
        settle(ioc);
        EXPECT_FALSE(read->done);

        source.write("lo");
        settle(ioc);
        ASSERT_TRUE(read->done);
        EXPECT_EQ("hello", read->data());
    }

    TEST_F(pipe_fixture, writes_while_a_result_is_out_keep_the_buffer_stable)
    {
        source.write("one");
        auto first = read_now(ioc, reader);
        source.write("two");
        EXPECT_EQ("one", first.data());
        EXPECT_EQ(6u, source.buffered());

        reader.advance(3);
        auto second = read_now(ioc, reader);
        EXPECT_EQ("two", second.data());
    }

    TEST_F(pipe_fixture, completion_is_reported_with_the_last_bytes)
    {
        source.write("end");
        source.complete();
        auto read = read_now(ioc, reader);
        EXPECT_EQ("end", read.data());
        EXPECT_TRUE(read.result.is_completed);
        reader.advance(3);

        auto last = read_now(ioc, reader);
        EXPECT_EQ(0u, last.size());
        EXPECT_TRUE(last.result.is_completed);
    }

    TEST_F(pipe_fixture, completion_wakes_a_pending_read)
    {
        auto read = start_read(reader);
        settle(ioc);
        EXPECT_FALSE(read->done);

        source.complete();
        settle(ioc);
        ASSERT_TRUE(read->done);
        EXPECT_TRUE(read->result.is_completed);
    }

    TEST_F(pipe_fixture, staged_bytes_hold_back_completion)
    {
        source.write("a");
        auto first = read_now(ioc, reader);
        source.write("b");
        source.complete();
        EXPECT_FALSE(first.result.is_completed);
        reader.advance(1);

        auto second = read_now(ioc, reader);
        EXPECT_EQ("b", second.data());
        EXPECT_TRUE(second.result.is_completed);
    }

    TEST_F(pipe_fixture, cancel_ends_the_pending_read)
    {
        auto read = start_read(reader);
        settle(ioc);
        reader.cancel_pending_read();
        settle(ioc);
        ASSERT_TRUE(read->done);
        EXPECT_FALSE(read->ec);
        EXPECT_TRUE(read->result.is_canceled);
        reader.advance(0);

        source.write("x");
        auto next = read_now(ioc, reader);
        EXPECT_FALSE(next.result.is_canceled);
        EXPECT_EQ("x", next.data());
    }

    TEST_F(pipe_fixture, cancel_without_a_read_applies_to_the_next_one)
    {
        source.write("x");
        reader.cancel_pending_read();
        auto read = read_now(ioc, reader);
        EXPECT_TRUE(read.result.is_canceled);
        EXPECT_EQ("x", read.data());
    }

    TEST_F(pipe_fixture, misuse_is_rejected)
    {
        EXPECT_THROW(reader.advance(0), std::logic_error);

        auto read = start_read(reader);
        EXPECT_THROW(start_read(reader), std::logic_error);
        source.write("ab");
        settle(ioc);
        ASSERT_TRUE(read->done);

        EXPECT_THROW(start_read(reader), std::logic_error);
        EXPECT_THROW(reader.advance(3), std::out_of_range);
        EXPECT_THROW(reader.advance(2, 1), std::out_of_range);
        reader.advance(2);

        source.complete();
        EXPECT_THROW(source.write("c"), std::logic_error);
    }

}
}
