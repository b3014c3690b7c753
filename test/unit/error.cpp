//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

// Test that header file is self-contained.
#include <boost/upload/error.hpp>

#include <boost/upload/test/error.hpp>
#include <boost/core/lightweight_test.hpp>
#include <cstring>

namespace boost {
namespace upload {

struct error_test
{
    void
    check(error e)
    {
        system::error_code ec = e;
        BOOST_TEST(ec.failed());
        BOOST_TEST_EQ(std::strcmp(ec.category().name(), "boost.upload"), 0);
        BOOST_TEST(! ec.message().empty());
        BOOST_TEST_NE(ec.message(), "unknown");
        BOOST_TEST(ec == e);
        BOOST_TEST(&ec.category() == &make_error_code(e).category());
    }

    void
    run()
    {
        check(error::cannot_seek);
        check(error::stream_failure);
        check(error::short_read);

        system::error_code ec = error::success;
        BOOST_TEST(! ec.failed());

        system::error_code sec = test::error::stream_read_failed;
        system::error_code cec = test::error::channel_read_failed;
        BOOST_TEST(sec.failed());
        BOOST_TEST(cec.failed());
        BOOST_TEST(sec != cec);
        BOOST_TEST(&sec.category() == &cec.category());
        BOOST_TEST_EQ(std::strcmp(sec.category().name(), "boost.upload.test"), 0);
        BOOST_TEST_EQ(sec.message(), "simulated stream read failure");
        BOOST_TEST_EQ(cec.message(), "simulated channel read failure");
        BOOST_TEST(sec != make_error_code(error::stream_failure));
    }
};

} // upload
} // boost

int
main()
{
    boost::upload::error_test().run();
    return boost::report_errors();
}
