//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_BODY_SOURCE_HPP
#define BOOST_UPLOAD_BODY_SOURCE_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/upload/detail/except.hpp>
#include <boost/upload/pull_result.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>

namespace boost {
namespace upload {

/** A non-blocking source of HTTP request body data.

    The transport pulls the body by repeatedly calling
    @ref pull with the number of bytes it can accept.
    Each call returns immediately with one of:

    @li bytes, never more than requested and never empty,
    @li `done` once the source is exhausted,
    @li `retry_later` when no bytes are ready yet but more
        will come, or
    @li `error` when a fault occurred.

    Once `done` or `error` is returned, every later call
    returns the same result.

    Implementations in this library:
    @li @ref memory_source for bytes held in memory,
    @li @ref stream_source for a @ref readable_stream,
    @li @ref file_source for a file read asynchronously.

    @par Thread Safety
    Unsafe. All calls on one object, and all of its
    completion callbacks, must run on the same strand.
*/
class BOOST_SYMBOL_VISIBLE
    body_source
{
public:
    /** Destructor
    */
    BOOST_UPLOAD_DECL
    virtual ~body_source();

    body_source() = default;
    body_source(body_source const&) = delete;
    body_source& operator=(body_source const&) = delete;

    /** Return the next bytes of the body

        @param max_length The largest number of bytes the
        caller accepts. Must be greater than zero.
    */
    virtual
    pull_result
    pull(std::size_t max_length) = 0;

    /** Reposition the source

        After a successful call the next @ref pull returns
        bytes starting at absolute offset `offset`.

        @param ec Set to @ref error::cannot_seek when the
        source cannot reposition to `offset`.
    */
    virtual
    void
    seek(
        std::uint64_t offset,
        system::error_code& ec) = 0;

    /** Reposition the source

        @throw system::system_error on failure.
    */
    void
    seek(std::uint64_t offset)
    {
        system::error_code ec;
        seek(offset, ec);
        if(ec.failed())
            detail::throw_system_error(ec);
    }

    /** Return `true` if the size of the body is known
    */
    virtual
    bool
    has_size() const noexcept
    {
        return false;
    }

    /** Return the size of the body in bytes

        @throw std::invalid_argument if @ref has_size returns `false`.
    */
    virtual
    std::uint64_t
    size() const
    {
        detail::throw_invalid_argument(
            "body size is unknown");
    }
};

} // upload
} // boost

#endif
