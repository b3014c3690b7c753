//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_SOURCE_CONFIG_HPP
#define BOOST_UPLOAD_SOURCE_CONFIG_HPP

#include <boost/upload/detail/config.hpp>
#include <cstddef>

namespace boost {
namespace upload {

/** Settings for sources which read ahead
*/
struct source_config
{
    /** The transport's preferred write size

        This is the largest number of bytes the transport
        usually pulls at once. File channels deliver
        bytes in pieces of at most this size.
    */
    std::size_t max_write_size =
        BOOST_UPLOAD_MAX_WRITE_SIZE;

    /** The read-ahead target, in multiples of the write size
    */
    std::size_t buffer_multiple =
        BOOST_UPLOAD_BUFFER_MULTIPLE;

    /** Return the number of bytes to keep buffered
    */
    std::size_t
    high_water_mark() const noexcept
    {
        return max_write_size * buffer_multiple;
    }

    /** Throw if the settings are unusable

        @throw std::invalid_argument a field is zero, or
        @ref high_water_mark does not fit in `std::size_t`.
    */
    BOOST_UPLOAD_DECL
    void
    validate() const;
};

} // upload
} // boost

#endif
