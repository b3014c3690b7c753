//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_DETAIL_EXCEPT_HPP
#define BOOST_UPLOAD_DETAIL_EXCEPT_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace upload {
namespace detail {

// Thrown when a collaborator breaks its contract.
// Never used for conditions a caller can recover from.
BOOST_UPLOAD_DECL void BOOST_NORETURN throw_logic_error(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_UPLOAD_DECL void BOOST_NORETURN throw_invalid_argument(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_UPLOAD_DECL void BOOST_NORETURN throw_system_error(
    system::error_code const& ec,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // upload
} // boost

#endif
