//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_PULL_RESULT_HPP
#define BOOST_UPLOAD_PULL_RESULT_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/upload/chunk.hpp>
#include <boost/system/error_code.hpp>
#include <iosfwd>
#include <utility>

namespace boost {
namespace upload {

/** The availability of body data
*/
enum class availability
{
    /// At least one byte is available now
    data,

    /// The source is exhausted
    done,

    /// Nothing is available now; poll again later
    retry_later,

    /// An unrecoverable fault occurred
    error
};

/** The result of pulling from a body source
*/
class pull_result
{
public:
    /** Return a result holding bytes

        @par Preconditions
        `! c.empty()`
    */
    static
    pull_result
    data(chunk c) noexcept
    {
        return pull_result(
            availability::data, std::move(c), {});
    }

    /** Return a result indicating the source is exhausted
    */
    static
    pull_result
    done() noexcept
    {
        return pull_result(
            availability::done, {}, {});
    }

    /** Return a result indicating nothing is available yet
    */
    static
    pull_result
    retry_later() noexcept
    {
        return pull_result(
            availability::retry_later, {}, {});
    }

    /** Return a result indicating a fault
    */
    static
    pull_result
    failure(system::error_code ec) noexcept
    {
        return pull_result(
            availability::error, {}, ec);
    }

    availability
    kind() const noexcept
    {
        return kind_;
    }

    bool
    has_data() const noexcept
    {
        return kind_ == availability::data;
    }

    bool
    is_done() const noexcept
    {
        return kind_ == availability::done;
    }

    bool
    is_retry_later() const noexcept
    {
        return kind_ == availability::retry_later;
    }

    bool
    is_error() const noexcept
    {
        return kind_ == availability::error;
    }

    /** Return `true` if no further data will be produced
    */
    bool
    is_terminal() const noexcept
    {
        return kind_ == availability::done ||
            kind_ == availability::error;
    }

    /** Return the bytes

        Empty unless @ref has_data returns `true`.
    */
    chunk const&
    bytes() const noexcept
    {
        return chunk_;
    }

    /** Return the fault

        Set only when @ref is_error returns `true`.
    */
    system::error_code
    error() const noexcept
    {
        return ec_;
    }

private:
    pull_result(
        availability k,
        chunk c,
        system::error_code ec) noexcept
        : kind_(k)
        , chunk_(std::move(c))
        , ec_(ec)
    {
    }

    availability kind_;
    chunk chunk_;
    system::error_code ec_;
};

BOOST_UPLOAD_DECL
std::ostream&
operator<<(
    std::ostream& os,
    availability a);

} // upload
} // boost

#endif
