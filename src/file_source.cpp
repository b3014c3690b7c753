//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#include <boost/upload/file_source.hpp>
#include <boost/upload/posix_file_channel.hpp>
#include <boost/upload/detail/except.hpp>
#include <boost/upload/error.hpp>
#include <boost/upload/logger.hpp>
#include <algorithm>

namespace boost {
namespace upload {

struct file_source::impl
    : std::enable_shared_from_this<impl>
{
    enum class state
    {
        empty,
        error_detected,
        buffered,
        final_buffered
    };

    std::unique_ptr<file_channel> channel;
    std::function<void()> on_data_available;
    source_config cfg;
    section sect;

    state st = state::empty;

    // Bytes of buffered or final_buffered. A final
    // buffer with no bytes left means end of file.
    chunk buf;
    system::error_code ec;

    bool in_flight = false;
    std::size_t requested = 0;
    std::size_t received = 0;

    impl(
        std::unique_ptr<file_channel> ch,
        std::function<void()> handler,
        source_config const& cfg_)
        : channel(std::move(ch))
        , on_data_available(std::move(handler))
        , cfg(cfg_)
        , sect(get_section("upload.file_source"))
    {
        if(! channel)
            detail::throw_invalid_argument(
                "null file channel");
        cfg.validate();
    }

    bool
    is_terminal() const noexcept
    {
        return
            st == state::error_detected ||
            st == state::final_buffered;
    }

    std::size_t
    available() const noexcept
    {
        if(st == state::buffered ||
            st == state::final_buffered)
            return buf.size();
        return 0;
    }

    void
    append(chunk data, bool eof)
    {
        switch(st)
        {
        case state::empty:
            if(eof)
            {
                buf = std::move(data);
                st = state::final_buffered;
            }
            else if(! data.empty())
            {
                buf = std::move(data);
                st = state::buffered;
            }
            break;

        case state::buffered:
            buf = upload::append(buf, data);
            if(eof)
                st = state::final_buffered;
            break;

        case state::error_detected:
            detail::throw_logic_error(
                "file read completed after an error");

        case state::final_buffered:
            detail::throw_logic_error(
                "file read completed after end of file");
        }
    }

    void
    read_next_chunk()
    {
        if(in_flight)
            return;
        auto const n = available();
        auto const hwm = cfg.high_water_mark();
        if(n >= hwm)
            return;
        requested = hwm - n;
        received = 0;
        in_flight = true;
        LOG_TRC(sect)("read {} bytes, {} buffered",
            requested, n);
        std::weak_ptr<impl> wp = shared_from_this();
        channel->async_read(requested,
            [wp](
                system::error_code ec,
                bool done,
                boost::optional<chunk> data)
            {
                auto sp = wp.lock();
                if(! sp)
                    return;
                sp->on_read(ec, done, std::move(data));
            });
    }

    void
    on_read(
        system::error_code ec,
        bool done,
        boost::optional<chunk> data)
    {
        if(! in_flight)
            detail::throw_logic_error(
                "file read completed with no read outstanding");

        bool const waiting =
            available() == 0 && ! is_terminal();

        if(data)
        {
            received += data->size();
            if(received > requested)
                detail::throw_logic_error(
                    "file read returned more than requested");
        }

        if(done)
        {
            in_flight = false;
            if(ec.failed())
            {
                LOG_WRN(sect)("read failed: {}",
                    ec.message());
                buf = {};
                this->ec = ec;
                st = state::error_detected;
            }
            else
            {
                LOG_DBG(sect)("end of file, {} trailing bytes",
                    data ? data->size() : 0);
                append(data ? std::move(*data) : chunk(), true);
            }
        }
        else if(! ec.failed() && data)
        {
            if(received == requested)
                in_flight = false;
            append(std::move(*data), false);
        }
        else
        {
            detail::throw_logic_error(
                "malformed file read completion");
        }

        if(waiting &&
            (available() > 0 || is_terminal()) &&
            on_data_available)
            on_data_available();
    }

    pull_result
    pull(std::size_t max_length)
    {
        switch(st)
        {
        case state::empty:
            read_next_chunk();
            return pull_result::retry_later();

        case state::error_detected:
            return pull_result::failure(ec);

        case state::buffered:
        {
            auto parts = split(buf,
                (std::min)(max_length, buf.size()));
            buf = std::move(parts.second);
            if(buf.empty())
                st = state::empty;
            read_next_chunk();
            if(parts.first.empty())
                return pull_result::retry_later();
            return pull_result::data(
                std::move(parts.first));
        }

        case state::final_buffered:
        {
            if(buf.empty())
                return pull_result::done();
            // done is terminal, so a zero-length
            // pull must not end the body early
            if(max_length == 0)
                return pull_result::retry_later();
            auto parts = split(buf,
                (std::min)(max_length, buf.size()));
            buf = std::move(parts.second);
            return pull_result::data(
                std::move(parts.first));
        }
        }
        return pull_result::retry_later();
    }
};

//------------------------------------------------

file_source::
file_source(
    std::unique_ptr<file_channel> channel,
    std::function<void()> on_data_available,
    source_config const& cfg)
    : impl_(std::make_shared<impl>(
        std::move(channel),
        std::move(on_data_available),
        cfg))
{
}

file_source::
file_source(
    asio::any_io_executor ex,
    asio::any_io_executor io_ex,
    string_view path,
    std::function<void()> on_data_available,
    source_config const& cfg)
    : file_source(
        std::unique_ptr<file_channel>(
            new posix_file_channel(
                std::move(ex),
                std::move(io_ex),
                path,
                cfg.max_write_size)),
        std::move(on_data_available),
        cfg)
{
}

file_source::
~file_source()
{
    impl_->channel->close();
}

pull_result
file_source::
pull(std::size_t max_length)
{
    return impl_->pull(max_length);
}

void
file_source::
seek(
    std::uint64_t,
    system::error_code& ec)
{
    ec = error::cannot_seek;
}

bool
file_source::
has_size() const noexcept
{
    return impl_->channel->size() != boost::none;
}

std::uint64_t
file_source::
size() const
{
    auto const n = impl_->channel->size();
    if(! n)
        detail::throw_invalid_argument(
            "file size is unknown");
    return *n;
}

std::size_t
file_source::
buffered() const noexcept
{
    return impl_->available();
}

bool
file_source::
read_in_flight() const noexcept
{
    return impl_->in_flight;
}

std::size_t
file_source::
high_water_mark() const noexcept
{
    return impl_->cfg.high_water_mark();
}

} // upload
} // boost
