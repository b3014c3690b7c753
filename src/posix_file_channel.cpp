//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#include <boost/upload/posix_file_channel.hpp>
#include <boost/upload/detail/except.hpp>
#include <boost/upload/error.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <string>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace boost {
namespace upload {

file_channel::
~file_channel() = default;

//------------------------------------------------

struct posix_file_channel::descriptor
{
    int fd = -1;
    bool busy = false;
    boost::optional<std::uint64_t> size;

    // only touched by the job on the I/O executor
    std::uint64_t offset = 0;

    explicit
    descriptor(int fd_) noexcept
        : fd(fd_)
    {
    }

    ~descriptor()
    {
        if(fd != -1)
            ::close(fd);
    }

    descriptor(descriptor const&) = delete;
    descriptor& operator=(descriptor const&) = delete;
};

std::shared_ptr<posix_file_channel::descriptor>
posix_file_channel::
open_descriptor(
    string_view path,
    system::error_code& ec)
{
    std::string const s(path.data(), path.size());
    int fd;
    do
    {
        fd = ::open(s.c_str(), O_RDONLY | O_CLOEXEC);
    }
    while(fd == -1 && errno == EINTR);
    if(fd == -1)
    {
        ec.assign(errno, system::system_category());
        return nullptr;
    }
    auto d = std::make_shared<descriptor>(fd);
    struct stat st;
    if(::fstat(fd, &st) != 0)
    {
        ec.assign(errno, system::system_category());
        return nullptr;
    }
    if(S_ISDIR(st.st_mode))
    {
        ec.assign(EISDIR, system::system_category());
        return nullptr;
    }
    if(S_ISREG(st.st_mode))
        d->size = static_cast<std::uint64_t>(st.st_size);
    ec = {};
    return d;
}

posix_file_channel::
posix_file_channel(
    asio::any_io_executor completion_ex,
    asio::any_io_executor io_ex,
    std::shared_ptr<descriptor> desc,
    std::size_t piece_size)
    : cex_(std::move(completion_ex))
    , iex_(std::move(io_ex))
    , desc_(std::move(desc))
    , piece_size_(piece_size)
    , sect_(get_section("upload.file_channel"))
{
    if(piece_size_ == 0)
        detail::throw_invalid_argument(
            "piece_size is zero");
}

posix_file_channel::
posix_file_channel(
    asio::any_io_executor completion_ex,
    asio::any_io_executor io_ex,
    string_view path,
    std::size_t piece_size)
    : posix_file_channel(
        std::move(completion_ex),
        std::move(io_ex),
        [&]
        {
            system::error_code ec;
            auto d = open_descriptor(path, ec);
            if(ec.failed())
                detail::throw_system_error(ec);
            return d;
        }(),
        piece_size)
{
    LOG_DBG(sect_)("open {}", path);
}

std::unique_ptr<posix_file_channel>
posix_file_channel::
open(
    asio::any_io_executor completion_ex,
    asio::any_io_executor io_ex,
    string_view path,
    std::size_t piece_size,
    system::error_code& ec)
{
    auto d = open_descriptor(path, ec);
    if(ec.failed())
    {
        LOG_WRN(get_section("upload.file_channel"))(
            "open {}: {}", path, ec.message());
        return nullptr;
    }
    return std::unique_ptr<posix_file_channel>(
        new posix_file_channel(
            std::move(completion_ex),
            std::move(io_ex),
            std::move(d),
            piece_size));
}

posix_file_channel::
~posix_file_channel()
{
    close();
}

void
posix_file_channel::
async_read(
    std::size_t length,
    read_handler handler)
{
    auto h = std::make_shared<read_handler>(
        std::move(handler));
    if(! desc_)
    {
        asio::post(cex_,
            [h]
            {
                (*h)(asio::error::bad_descriptor,
                    true, boost::none);
            });
        return;
    }
    if(desc_->busy)
        detail::throw_logic_error(
            "overlapping reads on a file channel");
    desc_->busy = true;

    LOG_TRC(sect_)("async_read fd={} length={}",
        desc_->fd, length);

    auto d = desc_;
    auto cex = cex_;
    auto const piece = piece_size_;

    // The busy flag is cleared on the completion
    // executor, just before the last invocation.
    auto deliver =
        [d, cex, h](
            system::error_code ec,
            bool done,
            boost::optional<chunk> data,
            bool last)
        {
            asio::post(cex,
                [d, h, ec, done, data, last]
                {
                    if(last)
                        d->busy = false;
                    (*h)(ec, done, data);
                });
        };

    asio::post(iex_,
        [d, piece, length, deliver]
        {
            std::size_t total = 0;
            // The latest piece is held back until the next
            // read shows whether the file has ended, so the
            // trailing bytes ride on the final invocation.
            boost::optional<chunk> held;
            for(;;)
            {
                if(total == length)
                {
                    if(held)
                        deliver({}, false, std::move(held), true);
                    else
                        deliver({}, false, chunk(), true);
                    return;
                }
                auto const want =
                    (std::min)(piece, length - total);
                std::unique_ptr<char[]> p(new char[want]);
                auto const n = ::read(d->fd, p.get(), want);
                if(n < 0)
                {
                    if(errno == EINTR)
                        continue;
                    system::error_code ec(
                        errno, system::system_category());
                    deliver(ec, true, boost::none, true);
                    return;
                }
                if(n == 0)
                {
                    if(d->size && d->offset < *d->size)
                    {
                        // the file shrank after it was opened
                        deliver(error::short_read,
                            true, boost::none, true);
                        return;
                    }
                    deliver({}, true, std::move(held), true);
                    return;
                }
                if(held)
                    deliver({}, false, std::move(held), false);
                held = chunk(std::move(p), want).subchunk(
                    0, static_cast<std::size_t>(n));
                total += static_cast<std::size_t>(n);
                d->offset += static_cast<std::uint64_t>(n);
            }
        });
}

boost::optional<std::uint64_t>
posix_file_channel::
size() const noexcept
{
    if(! desc_)
        return boost::none;
    return desc_->size;
}

void
posix_file_channel::
close() noexcept
{
    if(! desc_)
        return;
    LOG_DBG(sect_)("close fd={}", desc_->fd);
    // pending reads keep the descriptor alive
    desc_.reset();
}

} // upload
} // boost
