//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#include <boost/upload/chunk.hpp>
#include <boost/upload/detail/except.hpp>
#include <cstring>

namespace boost {
namespace upload {

chunk::
chunk(
    std::unique_ptr<char[]> p,
    std::size_t n)
{
    if(! p || n == 0)
        return;
    p_ = p.get();
    size_ = n;
    storage_ = std::shared_ptr<char const>(
        p.release(), std::default_delete<char const[]>());
}

chunk
chunk::
subchunk(
    std::size_t pos,
    std::size_t n) const
{
    if(pos > size_)
        detail::throw_invalid_argument(
            "chunk position out of range");
    if(n > size_ - pos)
        n = size_ - pos;
    if(n == 0)
        return {};
    return chunk(storage_, p_ + pos, n);
}

//------------------------------------------------

chunk
make_chunk(
    void const* data,
    std::size_t size)
{
    if(size == 0)
        return {};
    std::unique_ptr<char[]> p(new char[size]);
    std::memcpy(p.get(), data, size);
    return chunk(std::move(p), size);
}

chunk
make_chunk(std::string s)
{
    if(s.empty())
        return {};
    auto sp = std::make_shared<std::string const>(std::move(s));
    auto const p = sp->data();
    auto const n = sp->size();
    return chunk(std::move(sp), p, n);
}

std::pair<chunk, chunk>
split(
    chunk const& c,
    std::size_t pos)
{
    if(pos > c.size())
        detail::throw_invalid_argument(
            "split position out of range");
    return { c.subchunk(0, pos), c.subchunk(pos) };
}

chunk
append(
    chunk const& a,
    chunk const& b)
{
    if(b.empty())
        return a;
    if(a.empty())
        return b;
    auto const n = a.size() + b.size();
    std::unique_ptr<char[]> p(new char[n]);
    std::memcpy(p.get(), a.data(), a.size());
    std::memcpy(p.get() + a.size(), b.data(), b.size());
    return chunk(std::move(p), n);
}

std::size_t
copy(
    asio::mutable_buffer dest,
    chunk const& c)
{
    if(dest.size() < c.size())
        detail::throw_invalid_argument(
            "destination buffer too small");
    if(c.empty())
        return 0;
    std::memcpy(dest.data(), c.data(), c.size());
    return c.size();
}

} // upload
} // boost
