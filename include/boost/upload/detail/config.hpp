//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_DETAIL_CONFIG_HPP
#define BOOST_UPLOAD_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

namespace boost {
namespace upload {

# if (defined(BOOST_UPLOAD_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_UPLOAD_STATIC_LINK)
#  if defined(BOOST_UPLOAD_SOURCE)
#   define BOOST_UPLOAD_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_UPLOAD_CLASS_DECL  BOOST_SYMBOL_EXPORT
#   define BOOST_UPLOAD_BUILD_DLL
#  else
#   define BOOST_UPLOAD_DECL        BOOST_SYMBOL_IMPORT
#   define BOOST_UPLOAD_CLASS_DECL  BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib
# ifndef  BOOST_UPLOAD_DECL
#  define BOOST_UPLOAD_DECL
# endif
# ifndef  BOOST_UPLOAD_CLASS_DECL
#  define BOOST_UPLOAD_CLASS_DECL
# endif

//------------------------------------------------

// The preferred write size of the transport.
// This matches libcurl's CURL_MAX_WRITE_SIZE.
#ifndef BOOST_UPLOAD_MAX_WRITE_SIZE
#define BOOST_UPLOAD_MAX_WRITE_SIZE 16384
#endif

// Read-ahead target, as a multiple of the write size
#ifndef BOOST_UPLOAD_BUFFER_MULTIPLE
#define BOOST_UPLOAD_BUFFER_MULTIPLE 3
#endif

} // upload
} // boost

#endif
