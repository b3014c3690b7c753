//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

// Test that header file is self-contained.
#include <boost/upload/file_source.hpp>

#include <boost/upload/error.hpp>
#include <boost/upload/test/channel.hpp>
#include <boost/upload/test/error.hpp>
#include "test_helpers.hpp"

#include <limits>
#include <stdexcept>

namespace boost {
namespace upload {

struct file_source_test
{
    using control = test::channel::control;

    struct fixture
    {
        std::shared_ptr<control> ctl;
        std::size_t notified = 0;
        std::unique_ptr<file_source> src;

        explicit
        fixture(
            source_config const& cfg = {},
            test::channel* ch = new test::channel)
        {
            std::unique_ptr<test::channel> up(ch);
            ctl = up->get_control();
            src.reset(new file_source(
                std::move(up),
                [this]{ ++notified; },
                cfg));
        }
    };

    static
    source_config
    small_config()
    {
        source_config cfg;
        cfg.max_write_size = 4;
        cfg.buffer_multiple = 3;
        return cfg;
    }

    void
    testBackpressure()
    {
        fixture f;

        // nothing is read until the first pull
        BOOST_TEST(f.ctl->requests.empty());
        BOOST_TEST(! f.src->read_in_flight());

        BOOST_TEST(f.src->pull(1000).is_retry_later());
        BOOST_TEST_EQ(f.ctl->requests.size(), 1u);
        BOOST_TEST_EQ(f.ctl->requests[0], 49152u);
        BOOST_TEST(f.src->read_in_flight());

        // pulling again does not issue another read
        BOOST_TEST(f.src->pull(1000).is_retry_later());
        BOOST_TEST_EQ(f.ctl->requests.size(), 1u);
        BOOST_TEST_EQ(f.notified, 0u);

        f.ctl->deliver("hello");
        BOOST_TEST_EQ(f.notified, 1u);
        BOOST_TEST_EQ(f.src->buffered(), 5u);

        // bytes joining a non-empty buffer do not notify
        f.ctl->deliver("world");
        BOOST_TEST_EQ(f.notified, 1u);

        auto r = f.src->pull(1000);
        BOOST_TEST(r.has_data());
        BOOST_TEST_EQ(r.bytes().view(), "helloworld");

        // the first read is still outstanding
        BOOST_TEST(f.src->pull(1000).is_retry_later());
        BOOST_TEST_EQ(f.ctl->requests.size(), 1u);
        BOOST_TEST_EQ(f.ctl->overlaps, 0u);

        f.ctl->deliver("!");
        BOOST_TEST_EQ(f.notified, 2u);
        BOOST_TEST_EQ(f.src->pull(1000).bytes().view(), "!");
    }

    void
    testHighWaterMark()
    {
        fixture f(small_config());
        BOOST_TEST_EQ(f.src->high_water_mark(), 12u);

        BOOST_TEST(f.src->pull(4).is_retry_later());
        BOOST_TEST_EQ(f.ctl->requests.back(), 12u);

        f.ctl->deliver("0123");
        f.ctl->deliver("4567");
        BOOST_TEST(f.src->read_in_flight());
        f.ctl->deliver("89ab");

        // the full request was delivered
        BOOST_TEST(! f.src->read_in_flight());
        BOOST_TEST(! f.ctl->pending);
        BOOST_TEST_EQ(f.src->buffered(), 12u);

        BOOST_TEST_EQ(f.src->pull(4).bytes().view(), "0123");

        // the buffer is topped up to the mark
        BOOST_TEST_EQ(f.ctl->requests.size(), 2u);
        BOOST_TEST_EQ(f.ctl->requests.back(), 4u);
        BOOST_TEST_EQ(f.src->buffered(), 8u);
        BOOST_TEST(f.src->read_in_flight());

        // a pull smaller than the buffer leaves the rest
        BOOST_TEST_EQ(f.src->pull(3).bytes().view(), "456");
        BOOST_TEST_EQ(f.ctl->requests.size(), 2u);

        f.ctl->deliver("cdef");
        BOOST_TEST_EQ(f.src->buffered(), 9u);
        BOOST_TEST_EQ(f.src->pull(100).bytes().view(), "789abcdef");
        BOOST_TEST_EQ(f.ctl->requests.back(), 12u);
        BOOST_TEST_EQ(f.ctl->overlaps, 0u);
    }

    void
    testEofTrailing()
    {
        fixture f;
        BOOST_TEST(f.src->pull(10).is_retry_later());
        f.ctl->deliver("ab");
        f.ctl->finish("cd");
        BOOST_TEST(! f.src->read_in_flight());
        BOOST_TEST_EQ(f.notified, 1u);

        auto d = test::drain(*f.src, 3);
        BOOST_TEST(d.done);
        BOOST_TEST_EQ(d.body, "abcd");
        BOOST_TEST_EQ(d.retries, 0u);

        // no read follows the end of file
        BOOST_TEST_EQ(f.ctl->requests.size(), 1u);
        BOOST_TEST(f.src->pull(10).is_done());
        BOOST_TEST(f.src->pull(10).is_done());
    }

    void
    testEofOnly()
    {
        // trailing bytes present but empty
        {
            fixture f;
            BOOST_TEST(f.src->pull(10).is_retry_later());
            f.ctl->finish("");
            BOOST_TEST_EQ(f.notified, 1u);
            BOOST_TEST(f.src->pull(10).is_done());
            BOOST_TEST(f.src->pull(10).is_done());
        }

        // trailing bytes absent
        {
            fixture f;
            BOOST_TEST(f.src->pull(10).is_retry_later());
            f.ctl->finish();
            BOOST_TEST_EQ(f.notified, 1u);
            BOOST_TEST(f.src->pull(10).is_done());
        }

        // end of file after buffered bytes
        {
            fixture f;
            BOOST_TEST(f.src->pull(10).is_retry_later());
            f.ctl->deliver("xyz");
            f.ctl->finish();
            BOOST_TEST_EQ(f.notified, 1u);
            BOOST_TEST_EQ(f.src->pull(10).bytes().view(), "xyz");
            BOOST_TEST(f.src->pull(10).is_done());
        }

        // end of file at a request boundary
        {
            fixture f(small_config());
            BOOST_TEST(f.src->pull(12).is_retry_later());
            f.ctl->deliver("0123456789ab");
            BOOST_TEST_EQ(f.src->pull(12).bytes().view(), "0123456789ab");
            BOOST_TEST_EQ(f.ctl->requests.size(), 2u);
            f.ctl->finish();
            BOOST_TEST_EQ(f.notified, 2u);
            BOOST_TEST(f.src->pull(12).is_done());
        }
    }

    void
    testZeroLengthPull()
    {
        fixture f;
        BOOST_TEST(f.src->pull(0).is_retry_later());
        f.ctl->finish("abc");
        BOOST_TEST(f.src->pull(0).is_retry_later());
        BOOST_TEST_EQ(f.src->pull(10).bytes().view(), "abc");
        BOOST_TEST(f.src->pull(0).is_done());
    }

    void
    testError()
    {
        system::error_code const ec = test::error::channel_read_failed;

        {
            fixture f;
            BOOST_TEST(f.src->pull(10).is_retry_later());
            f.ctl->deliver("abc");
            f.ctl->fail(ec);
            BOOST_TEST(! f.src->read_in_flight());

            // buffered bytes are discarded
            BOOST_TEST_EQ(f.src->buffered(), 0u);
            for(int i = 0; i < 3; ++i)
            {
                auto r = f.src->pull(10);
                BOOST_TEST(r.is_error());
                BOOST_TEST(r.error() == ec);
            }
            BOOST_TEST_EQ(f.ctl->requests.size(), 1u);
        }

        // an error wakes a waiting consumer
        {
            fixture f;
            BOOST_TEST(f.src->pull(10).is_retry_later());
            f.ctl->fail();
            BOOST_TEST_EQ(f.notified, 1u);
            BOOST_TEST(f.src->pull(10).error() == ec);
        }
    }

    void
    testContractViolations()
    {
        // completion with no read outstanding
        {
            fixture f;
            BOOST_TEST(f.src->pull(10).is_retry_later());
            f.ctl->finish();
            BOOST_TEST_THROWS(
                f.ctl->complete({}, false, make_chunk("x", 1)),
                std::logic_error);
        }

        // error without the final flag
        {
            fixture f;
            BOOST_TEST(f.src->pull(10).is_retry_later());
            BOOST_TEST_THROWS(
                f.ctl->complete(test::error::channel_read_failed,
                    false, boost::none),
                std::logic_error);
        }

        // non-final completion without bytes
        {
            fixture f;
            BOOST_TEST(f.src->pull(10).is_retry_later());
            BOOST_TEST_THROWS(
                f.ctl->complete({}, false, boost::none),
                std::logic_error);
        }

        // more bytes than requested
        {
            fixture f(small_config());
            BOOST_TEST(f.src->pull(10).is_retry_later());
            BOOST_TEST_THROWS(
                f.ctl->deliver("0123456789abc"),
                std::logic_error);
        }
    }

    void
    testDestroy()
    {
        fixture f;
        BOOST_TEST(f.src->pull(10).is_retry_later());
        BOOST_TEST(! f.ctl->closed);
        f.src.reset();
        BOOST_TEST(f.ctl->closed);

        // a late completion is ignored
        f.ctl->deliver("late");
        f.ctl->finish();
        BOOST_TEST_EQ(f.notified, 0u);
    }

    void
    testReentrantPull()
    {
        // the consumer pulls from inside the notification
        std::shared_ptr<control> ctl;
        std::string body;
        file_source* psrc = nullptr;
        std::unique_ptr<test::channel> ch(new test::channel);
        ctl = ch->get_control();
        file_source src(
            std::move(ch),
            [&]
            {
                for(;;)
                {
                    auto r = psrc->pull(5);
                    if(! r.has_data())
                        break;
                    body.append(
                        r.bytes().data(), r.bytes().size());
                }
            },
            small_config());
        psrc = &src;

        BOOST_TEST(src.pull(5).is_retry_later());
        ctl->deliver("0123");
        BOOST_TEST_EQ(body, "0123");
        ctl->deliver("4567");
        BOOST_TEST_EQ(body, "01234567");
        ctl->finish("89");
        BOOST_TEST_EQ(body, "0123456789");
        BOOST_TEST(src.pull(5).is_done());
        BOOST_TEST_EQ(ctl->overlaps, 0u);
    }

    void
    testInterleaving()
    {
        // pulls and deliveries of varying sizes in
        // a fixed pseudo-random order
        auto const payload = test::pattern(20000);
        std::size_t const seeds[] = { 1, 7, 42, 1234 };
        for(auto seed : seeds)
        {
            source_config cfg;
            cfg.max_write_size = 64;
            cfg.buffer_multiple = 3;
            fixture f(cfg);

            std::uint32_t x = static_cast<std::uint32_t>(seed);
            auto next = [&x](std::uint32_t n)
            {
                x = x * 1103515245u + 12345u;
                return (x >> 8) % n;
            };

            std::string body;
            std::size_t sent = 0;
            bool finished = false;
            bool done = false;
            std::size_t steps = 0;
            while(! done && steps++ < 100000)
            {
                if(next(2) == 0)
                {
                    auto r = f.src->pull(1 + next(100));
                    BOOST_TEST(! r.is_error());
                    if(r.has_data())
                        body.append(
                            r.bytes().data(), r.bytes().size());
                    done = r.is_done();
                    continue;
                }
                if(! f.ctl->pending || finished)
                    continue;
                auto const want = f.ctl->requests.back();
                auto const left = payload.size() - sent;
                if(left == 0)
                {
                    f.ctl->finish();
                    finished = true;
                    continue;
                }
                auto n = (std::min)(left,
                    static_cast<std::size_t>(1 + next(64)));
                n = (std::min)(n, want - f.ctl->delivered());
                if(n == left && next(2) == 0)
                {
                    f.ctl->finish(string_view(
                        payload.data() + sent, n));
                    finished = true;
                }
                else
                {
                    f.ctl->deliver(string_view(
                        payload.data() + sent, n));
                }
                sent += n;
            }
            BOOST_TEST(done);
            BOOST_TEST_EQ(body, payload);
            BOOST_TEST_EQ(f.ctl->overlaps, 0u);
            for(auto n : f.ctl->requests)
                BOOST_TEST_LE(n, 192u);
        }
    }

    void
    testSize()
    {
        {
            fixture f({}, new test::channel(100));
            BOOST_TEST(f.src->has_size());
            BOOST_TEST_EQ(f.src->size(), 100u);
        }
        {
            fixture f;
            BOOST_TEST(! f.src->has_size());
            BOOST_TEST_THROWS(f.src->size(), std::invalid_argument);
        }
    }

    void
    testSeek()
    {
        fixture f;
        system::error_code ec;
        f.src->seek(0, ec);
        BOOST_TEST(ec == error::cannot_seek);
        BOOST_TEST_THROWS(f.src->seek(0), system::system_error);
    }

    void
    testConstruct()
    {
        BOOST_TEST_THROWS(
            file_source(nullptr, []{}),
            std::invalid_argument);

        source_config cfg;
        cfg.max_write_size = 0;
        BOOST_TEST_THROWS(
            file_source(std::unique_ptr<file_channel>(
                new test::channel), []{}, cfg),
            std::invalid_argument);

        cfg = {};
        cfg.buffer_multiple = 0;
        BOOST_TEST_THROWS(
            file_source(std::unique_ptr<file_channel>(
                new test::channel), []{}, cfg),
            std::invalid_argument);

        // the read-ahead target does not fit in a size_t
        cfg = {};
        cfg.max_write_size = std::size_t(1) <<
            (std::numeric_limits<std::size_t>::digits - 1);
        cfg.buffer_multiple = 2;
        BOOST_TEST_THROWS(
            file_source(std::unique_ptr<file_channel>(
                new test::channel), []{}, cfg),
            std::invalid_argument);

        // the largest target which fits is accepted
        cfg.buffer_multiple = 1;
        {
            file_source src(std::unique_ptr<file_channel>(
                new test::channel), []{}, cfg);
            BOOST_TEST_EQ(src.high_water_mark(),
                cfg.max_write_size);
        }
    }

    void
    run()
    {
        testBackpressure();
        testHighWaterMark();
        testEofTrailing();
        testEofOnly();
        testZeroLengthPull();
        testError();
        testContractViolations();
        testDestroy();
        testReentrantPull();
        testInterleaving();
        testSize();
        testSeek();
        testConstruct();
    }
};

} // upload
} // boost

int
main()
{
    boost::upload::file_source_test().run();
    return boost::report_errors();
}
