//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#include <boost/upload/memory_source.hpp>
#include <boost/upload/error.hpp>
#include <algorithm>

namespace boost {
namespace upload {

memory_source::
memory_source(chunk payload) noexcept
    : remaining_(payload)
    , original_(std::move(payload))
{
}

pull_result
memory_source::
pull(std::size_t max_length)
{
    if(remaining_.empty())
        return pull_result::done();
    auto parts = split(remaining_,
        (std::min)(max_length, remaining_.size()));
    remaining_ = std::move(parts.second);
    if(parts.first.empty())
        return pull_result::retry_later();
    return pull_result::data(std::move(parts.first));
}

void
memory_source::
seek(
    std::uint64_t offset,
    system::error_code& ec)
{
    if(offset >= original_.size())
    {
        ec = error::cannot_seek;
        return;
    }
    remaining_ = original_.subchunk(
        static_cast<std::size_t>(offset));
    ec = {};
}

} // upload
} // boost
