//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#include <boost/upload/stream_source.hpp>
#include <boost/upload/detail/except.hpp>
#include <boost/upload/error.hpp>

namespace boost {
namespace upload {

stream_source::
stream_source(
    std::unique_ptr<readable_stream> stream)
    : stream_(std::move(stream))
{
    if(! stream_)
        detail::throw_invalid_argument(
            "null readable stream");
}

pull_result
stream_source::
pull(std::size_t max_length)
{
    if(ec_.failed())
        return pull_result::failure(ec_);
    if(done_)
        return pull_result::done();

    if(! stream_->available())
    {
        done_ = true;
        return pull_result::done();
    }
    if(max_length == 0)
        return pull_result::retry_later();

    std::unique_ptr<char[]> p(new char[max_length]);
    system::error_code ec;
    auto const n = stream_->read(
        asio::mutable_buffer(p.get(), max_length), ec);
    if(ec.failed())
    {
        ec_ = ec;
        return pull_result::failure(ec_);
    }
    if(n == 0)
    {
        done_ = true;
        return pull_result::done();
    }
    if(n > max_length)
        detail::throw_logic_error(
            "readable_stream read past the buffer");
    // a short read is copied so the
    // chunk does not pin max_length bytes
    if(n < max_length)
        return pull_result::data(make_chunk(p.get(), n));
    return pull_result::data(chunk(std::move(p), n));
}

void
stream_source::
seek(
    std::uint64_t,
    system::error_code& ec)
{
    ec = error::cannot_seek;
}

} // upload
} // boost
