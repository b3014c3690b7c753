//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_STREAM_SOURCE_HPP
#define BOOST_UPLOAD_STREAM_SOURCE_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/upload/body_source.hpp>
#include <boost/upload/readable_stream.hpp>
#include <memory>

namespace boost {
namespace upload {

/** A body source reading from a readable stream

    Each call to @ref pull performs exactly one read on
    the stream; nothing is buffered.

    @note When the stream reports that no bytes are
    available, the source returns `done`, even if the
    stream would produce more bytes later. Streams which
    can stall must not be used with this source.
*/
class BOOST_SYMBOL_VISIBLE
    stream_source
    : public body_source
{
public:
    using body_source::seek;

    /** Constructor

        The source takes ownership of the stream.
    */
    BOOST_UPLOAD_DECL
    explicit
    stream_source(
        std::unique_ptr<readable_stream> stream);

    BOOST_UPLOAD_DECL
    pull_result
    pull(std::size_t max_length) override;

    /** Reposition the source

        Always fails with @ref error::cannot_seek.
    */
    BOOST_UPLOAD_DECL
    void
    seek(
        std::uint64_t offset,
        system::error_code& ec) override;

private:
    std::unique_ptr<readable_stream> stream_;
    system::error_code ec_;
    bool done_ = false;
};

} // upload
} // boost

#endif
