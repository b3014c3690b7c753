//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#include <boost/upload/readable_stream.hpp>
#include <boost/upload/error.hpp>
#include <istream>

namespace boost {
namespace upload {

readable_stream::
~readable_stream() = default;

//------------------------------------------------

istream_readable::
istream_readable(std::istream& is) noexcept
    : is_(is)
{
}

bool
istream_readable::
available()
{
    return is_.good();
}

std::size_t
istream_readable::
read(
    asio::mutable_buffer dest,
    system::error_code& ec)
{
    ec = {};
    if(dest.size() == 0)
        return 0;
    is_.read(static_cast<char*>(dest.data()),
        static_cast<std::streamsize>(dest.size()));
    if(is_.bad())
    {
        ec = error::stream_failure;
        return 0;
    }
    // a short read sets eofbit and failbit,
    // but the bytes read are still valid.
    return static_cast<std::size_t>(is_.gcount());
}

} // upload
} // boost
