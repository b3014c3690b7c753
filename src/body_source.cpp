//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#include <boost/upload/body_source.hpp>
#include <ostream>

namespace boost {
namespace upload {

body_source::
~body_source() = default;

std::ostream&
operator<<(
    std::ostream& os,
    availability a)
{
    switch(a)
    {
    case availability::data: return os << "data";
    case availability::done: return os << "done";
    case availability::retry_later: return os << "retry_later";
    case availability::error: return os << "error";
    }
    return os << "unknown";
}

} // upload
} // boost
