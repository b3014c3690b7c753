//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_CHUNK_HPP
#define BOOST_UPLOAD_CHUNK_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/utility/string_view.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace boost {
namespace upload {

/** An immutable, reference counted sequence of bytes

    Copies of a chunk share the same storage. Slicing
    a chunk with @ref split never copies the bytes;
    both halves keep the storage alive.

    @par Thread Safety
    Distinct objects: Safe.
    Shared objects: Safe. The bytes are never modified.
*/
class chunk
{
public:
    /** Constructor

        Default-constructed chunks are empty.
    */
    chunk() = default;

    /** Constructor

        Takes ownership of an allocation holding
        `n` valid bytes.
    */
    BOOST_UPLOAD_DECL
    chunk(
        std::unique_ptr<char[]> p,
        std::size_t n);

    /** Return the number of bytes
    */
    std::size_t
    size() const noexcept
    {
        return size_;
    }

    /** Return `true` if there are no bytes
    */
    bool
    empty() const noexcept
    {
        return size_ == 0;
    }

    /** Return a pointer to the first byte
    */
    char const*
    data() const noexcept
    {
        return p_;
    }

    /** Return the bytes as a buffer
    */
    asio::const_buffer
    buffer() const noexcept
    {
        return { p_, size_ };
    }

    /** Return the bytes as a string view
    */
    string_view
    view() const noexcept
    {
        return { p_, size_ };
    }

    /** Return a copy of the bytes as a string
    */
    std::string
    to_string() const
    {
        return std::string(p_, size_);
    }

    /** Return the bytes in `[pos, pos + n)`

        The result shares storage with `*this`.
        The count is clamped to the bytes available.

        @throw std::invalid_argument `pos > size()`
    */
    BOOST_UPLOAD_DECL
    chunk
    subchunk(
        std::size_t pos,
        std::size_t n = std::size_t(-1)) const;

    friend
    bool
    operator==(
        chunk const& a,
        chunk const& b) noexcept
    {
        return a.view() == b.view();
    }

    friend
    bool
    operator!=(
        chunk const& a,
        chunk const& b) noexcept
    {
        return !(a == b);
    }

private:
    friend BOOST_UPLOAD_DECL chunk make_chunk(std::string);

    chunk(
        std::shared_ptr<void const> storage,
        char const* p,
        std::size_t n) noexcept
        : storage_(std::move(storage))
        , p_(p)
        , size_(n)
    {
    }

    std::shared_ptr<void const> storage_;
    char const* p_ = nullptr;
    std::size_t size_ = 0;
};

//------------------------------------------------

/** Return a chunk holding a copy of the bytes
*/
BOOST_UPLOAD_DECL
chunk
make_chunk(
    void const* data,
    std::size_t size);

/** Return a chunk holding a copy of the buffer
*/
inline
chunk
make_chunk(asio::const_buffer b)
{
    return make_chunk(b.data(), b.size());
}

/** Return a chunk which takes ownership of a string

    The characters are not copied.
*/
BOOST_UPLOAD_DECL
chunk
make_chunk(std::string s);

/** Split a chunk into two at the given position

    The returned pair is `c[0, pos)` and `c[pos, c.size())`.
    Neither half copies the bytes.

    @throw std::invalid_argument `pos > c.size()`
*/
BOOST_UPLOAD_DECL
std::pair<chunk, chunk>
split(
    chunk const& c,
    std::size_t pos);

/** Return the concatenation of two chunks

    When either operand is empty the other is returned
    without copying. Otherwise the bytes are copied
    into new storage.
*/
BOOST_UPLOAD_DECL
chunk
append(
    chunk const& a,
    chunk const& b);

/** Copy the bytes of a chunk into a buffer

    @return The number of bytes copied, equal to `c.size()`.

    @throw std::invalid_argument `dest.size() < c.size()`
*/
BOOST_UPLOAD_DECL
std::size_t
copy(
    asio::mutable_buffer dest,
    chunk const& c);

} // upload
} // boost

#endif
