//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_FILE_SOURCE_HPP
#define BOOST_UPLOAD_FILE_SOURCE_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/upload/body_source.hpp>
#include <boost/upload/file_channel.hpp>
#include <boost/upload/source_config.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/utility/string_view.hpp>
#include <functional>
#include <memory>

namespace boost {
namespace upload {

/** A body source which reads a file ahead of the transport

    The source keeps up to @ref high_water_mark bytes
    buffered by issuing reads on a @ref file_channel,
    never more than one at a time. When @ref pull finds
    nothing buffered it returns `retry_later`, and the
    notification handler is invoked once bytes, the end
    of the file, or an error arrive.

    @par Thread Safety
    All member functions, the channel's completions, and
    the notification handler must run in the same
    serialization domain.

    @par Example
    @code
    asio::io_context ioc;
    file_source src(
        ioc.get_executor(), ioc.get_executor(),
        "body.bin",
        [&]{ transport.resume(); });
    @endcode
*/
class BOOST_SYMBOL_VISIBLE
    file_source
    : public body_source
{
public:
    using body_source::seek;

    /** Constructor

        @param channel The channel to read from.

        @param on_data_available Invoked from a read
        completion when the buffer stops being empty.

        @param cfg Buffer settings.

        @throw std::invalid_argument `channel` is null
        or `cfg` is unusable.
    */
    BOOST_UPLOAD_DECL
    file_source(
        std::unique_ptr<file_channel> channel,
        std::function<void()> on_data_available,
        source_config const& cfg = {});

    /** Constructor

        Opens `path` with a @ref posix_file_channel.
        Completions are posted to `ex`, and blocking
        reads run on `io_ex`.

        @throw system::system_error the file could not be opened.
    */
    BOOST_UPLOAD_DECL
    file_source(
        asio::any_io_executor ex,
        asio::any_io_executor io_ex,
        string_view path,
        std::function<void()> on_data_available,
        source_config const& cfg = {});

    /** Destructor

        Closes the channel. Completions arriving
        afterwards are ignored.
    */
    BOOST_UPLOAD_DECL
    ~file_source();

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

    BOOST_UPLOAD_DECL
    bool
    has_size() const noexcept override;

    BOOST_UPLOAD_DECL
    std::uint64_t
    size() const override;

    /** Return the number of bytes buffered
    */
    BOOST_UPLOAD_DECL
    std::size_t
    buffered() const noexcept;

    /** Return `true` if a channel read is outstanding
    */
    BOOST_UPLOAD_DECL
    bool
    read_in_flight() const noexcept;

    /** Return the read-ahead target in bytes
    */
    BOOST_UPLOAD_DECL
    std::size_t
    high_water_mark() const noexcept;

private:
    struct impl;

    std::shared_ptr<impl> impl_;
};

} // upload
} // boost

#endif
