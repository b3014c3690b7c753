//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_READABLE_STREAM_HPP
#define BOOST_UPLOAD_READABLE_STREAM_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <iosfwd>

namespace boost {
namespace upload {

/** A readable byte stream

    This is the interface a @ref stream_source reads from.
*/
class BOOST_SYMBOL_VISIBLE
    readable_stream
{
public:
    BOOST_UPLOAD_DECL
    virtual ~readable_stream();

    /** Return `true` if bytes can be read now
    */
    virtual
    bool
    available() = 0;

    /** Read some bytes

        @param dest The buffer to read into.
        @param ec Set to the error, if any occurred.
        @return The number of bytes read. Zero with no
        error indicates the end of the stream.
    */
    virtual
    std::size_t
    read(
        asio::mutable_buffer dest,
        system::error_code& ec) = 0;
};

//------------------------------------------------

/** A readable stream reading from a `std::istream`

    The istream is referenced, and must outlive
    this object.
*/
class BOOST_SYMBOL_VISIBLE
    istream_readable
    : public readable_stream
{
public:
    BOOST_UPLOAD_DECL
    explicit
    istream_readable(std::istream& is) noexcept;

    BOOST_UPLOAD_DECL
    bool
    available() override;

    BOOST_UPLOAD_DECL
    std::size_t
    read(
        asio::mutable_buffer dest,
        system::error_code& ec) override;

private:
    std::istream& is_;
};

} // upload
} // boost

#endif
