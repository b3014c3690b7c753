//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_FILE_CHANNEL_HPP
#define BOOST_UPLOAD_FILE_CHANNEL_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/upload/chunk.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>

namespace boost {
namespace upload {

/** An asynchronous, read-only channel to a file

    The channel reads the file sequentially. A read
    request delivers its bytes through the handler in
    one or more pieces:

    @li Each piece which is not the last of the file is
        delivered with `done == false`.

    @li When the end of the file is reached, the handler
        is invoked with `done == true` and the trailing
        bytes of the request, which may be empty or absent.

    @li When an error occurs, the handler is invoked with
        `done == true` and the error code. Bytes read by
        the request before the error are discarded.

    A request which delivers its full length before the
    end of the file is reached completes without a final
    invocation.

    All invocations of the handler happen on the
    execution context of the owner, never from
    within @ref async_read.
*/
class BOOST_SYMBOL_VISIBLE
    file_channel
{
public:
    /** The signature of read completion handlers
    */
    using read_handler = std::function<void(
        system::error_code ec,
        bool done,
        boost::optional<chunk> data)>;

    BOOST_UPLOAD_DECL
    virtual ~file_channel();

    /** Start reading up to `length` bytes

        @par Preconditions
        No other read is outstanding.
    */
    virtual
    void
    async_read(
        std::size_t length,
        read_handler handler) = 0;

    /** Return the size of the file, if known
    */
    virtual
    boost::optional<std::uint64_t>
    size() const noexcept = 0;

    /** Close the channel

        Outstanding reads complete or are dropped.
        Calling this more than once has no effect.
    */
    virtual
    void
    close() noexcept = 0;
};

} // upload
} // boost

#endif
