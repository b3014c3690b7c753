//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_POSIX_FILE_CHANNEL_HPP
#define BOOST_UPLOAD_POSIX_FILE_CHANNEL_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/upload/file_channel.hpp>
#include <boost/upload/logger.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/utility/string_view.hpp>
#include <memory>

namespace boost {
namespace upload {

/** A file channel using POSIX descriptors

    Blocking reads are performed on the I/O executor and
    their results are posted to the completion executor,
    which must be the serialization domain of the owner.
    Bytes are delivered in pieces of at most the piece
    size.
*/
class BOOST_SYMBOL_VISIBLE
    posix_file_channel
    : public file_channel
{
public:
    /** Constructor

        Opens `path` for reading.

        @throw system::system_error the file could not be opened.
    */
    BOOST_UPLOAD_DECL
    posix_file_channel(
        asio::any_io_executor completion_ex,
        asio::any_io_executor io_ex,
        string_view path,
        std::size_t piece_size =
            BOOST_UPLOAD_MAX_WRITE_SIZE);

    /** Open a channel, reporting failure through `ec`
    */
    BOOST_UPLOAD_DECL
    static
    std::unique_ptr<posix_file_channel>
    open(
        asio::any_io_executor completion_ex,
        asio::any_io_executor io_ex,
        string_view path,
        std::size_t piece_size,
        system::error_code& ec);

    BOOST_UPLOAD_DECL
    ~posix_file_channel();

    BOOST_UPLOAD_DECL
    void
    async_read(
        std::size_t length,
        read_handler handler) override;

    BOOST_UPLOAD_DECL
    boost::optional<std::uint64_t>
    size() const noexcept override;

    BOOST_UPLOAD_DECL
    void
    close() noexcept override;

    /** Return `true` if the channel has not been closed
    */
    bool
    is_open() const noexcept
    {
        return desc_ != nullptr;
    }

private:
    struct descriptor;

    posix_file_channel(
        asio::any_io_executor completion_ex,
        asio::any_io_executor io_ex,
        std::shared_ptr<descriptor> desc,
        std::size_t piece_size);

    static
    std::shared_ptr<descriptor>
    open_descriptor(
        string_view path,
        system::error_code& ec);

    asio::any_io_executor cex_;
    asio::any_io_executor iex_;
    std::shared_ptr<descriptor> desc_;
    std::size_t piece_size_;
    section sect_;
};

} // upload
} // boost

#endif
