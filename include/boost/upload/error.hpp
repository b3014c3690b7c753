//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_ERROR_HPP
#define BOOST_UPLOAD_ERROR_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

namespace boost {
namespace upload {

/** Error codes returned by body sources
*/
enum class error
{
    success = 0,

    /** The source cannot be repositioned to the requested offset.

        Stream and file sources never support seeking. Memory
        sources fail when the offset is not less than the size.
    */
    cannot_seek,

    /** The readable stream failed without a more specific error.
    */
    stream_failure,

    /** The file ended before its reported size was read.
    */
    short_read
};

} // upload

namespace system {
template<>
struct is_error_code_enum<
    ::boost::upload::error>
{
    static bool const value = true;
};
} // system

namespace upload {

namespace detail {
struct BOOST_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_UPLOAD_DECL const char* name(
        ) const noexcept override;
    BOOST_UPLOAD_DECL std::string message(
        int) const override;
    BOOST_UPLOAD_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x3a7e4c19b8d2f605)
    {
    }
};
BOOST_UPLOAD_DECL extern error_cat_type error_cat;
} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

} // upload
} // boost

#endif
