//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#include <boost/upload/source_config.hpp>
#include <boost/upload/detail/except.hpp>

namespace boost {
namespace upload {

void
source_config::
validate() const
{
    if(max_write_size == 0)
        detail::throw_invalid_argument(
            "max_write_size is zero");
    if(buffer_multiple == 0)
        detail::throw_invalid_argument(
            "buffer_multiple is zero");
    if(buffer_multiple > std::size_t(-1) / max_write_size)
        detail::throw_invalid_argument(
            "high water mark overflows");
}

} // upload
} // boost
