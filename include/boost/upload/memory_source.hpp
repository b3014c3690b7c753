//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_MEMORY_SOURCE_HPP
#define BOOST_UPLOAD_MEMORY_SOURCE_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/upload/body_source.hpp>
#include <boost/upload/chunk.hpp>

namespace boost {
namespace upload {

/** A body source holding its bytes in memory

    The bytes are held in a @ref chunk, so copies of the
    payload made elsewhere share storage with this source.
    The source can be repositioned to any offset inside
    the payload, and rewound.
*/
class BOOST_SYMBOL_VISIBLE
    memory_source
    : public body_source
{
public:
    using body_source::seek;

    /** Constructor
    */
    BOOST_UPLOAD_DECL
    explicit
    memory_source(chunk payload) noexcept;

    BOOST_UPLOAD_DECL
    pull_result
    pull(std::size_t max_length) override;

    /** Reposition the source

        Fails with @ref error::cannot_seek if
        `offset >= size()`.
    */
    BOOST_UPLOAD_DECL
    void
    seek(
        std::uint64_t offset,
        system::error_code& ec) override;

    /** Start over from the first byte
    */
    void
    rewind() noexcept
    {
        remaining_ = original_;
    }

    bool
    has_size() const noexcept override
    {
        return true;
    }

    std::uint64_t
    size() const override
    {
        return original_.size();
    }

    /** Return the number of bytes not yet pulled
    */
    std::size_t
    remaining() const noexcept
    {
        return remaining_.size();
    }

private:
    chunk remaining_;
    chunk original_;
};

} // upload
} // boost

#endif
