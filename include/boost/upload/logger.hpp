//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_LOGGER_HPP
#define BOOST_UPLOAD_LOGGER_HPP

#include <boost/upload/detail/config.hpp>
#include <boost/utility/string_view.hpp>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace boost {
namespace upload {

/** Severity levels used by the logging macros
*/
enum class log_level : int
{
    trace = 0,
    debug,
    info,
    warning,
    error,
    fatal,
    off
};

/** A named logging section

    Sections are cheap to copy; copies refer to the
    same name and threshold. Obtain one with
    @ref get_section.

    Messages use `{}` as the placeholder for each
    argument, which is formatted with `operator<<`.
*/
struct section
{
    BOOST_UPLOAD_DECL
    section() noexcept;

    /** Return the level below which logging is squelched
    */
    int threshold() const noexcept
    {
        if(! impl_)
            return static_cast<int>(log_level::off);
        return impl_->level;
    }

    /** Set the level below which logging is squelched
    */
    void set_threshold(log_level level) noexcept
    {
        if(impl_)
            impl_->level = static_cast<int>(level);
    }

    /** Return the name of the section
    */
    string_view name() const noexcept
    {
        if(! impl_)
            return {};
        return impl_->name;
    }

    template<class... Args>
    void operator()(
        string_view const& fs,
        Args const&... args)
    {
        auto const N = sizeof...(Args);
        std::size_t len[N + 1];
        std::stringstream ss;
        write(ss, len, args...);
        // VFALCO This makes an unnecessary copy
        std::string s(ss.str());
        format_impl(fs, s.data(), len, N);
    }

private:
    template<class T1, class... TN>
    static void write(
        std::stringstream& ss,
        std::size_t* plen,
        T1 const& t1,
        TN const&... tn)
    {
        auto const n0 = ss.str().size();
        ss << t1;
        *plen = ss.str().size() - n0;
        write(ss, ++plen, tn...);
    }

    static void write(
        std::stringstream&,
        std::size_t*)
    {
    }

    BOOST_UPLOAD_DECL
    void format_impl(string_view,
        char const*, std::size_t*, std::size_t n);

    BOOST_UPLOAD_DECL
    void write(string_view);

    explicit section(string_view);

    friend class log_sections;

    struct impl
    {
        std::string name;
        int level = static_cast<int>(log_level::warning);
    };

    std::shared_ptr<impl> impl_;
};

//------------------------------------------------

/** A collection of named sections
*/
class log_sections
{
public:
    /** Destructor
    */
    BOOST_UPLOAD_DECL
    ~log_sections();

    /** Constructor
    */
    BOOST_UPLOAD_DECL
    log_sections();

    log_sections(log_sections const&) = delete;
    log_sections& operator=(log_sections const&) = delete;

    /** Return a log section by name.

        If the section does not already exist, it is created.
        The name is case sensitive.
    */
    BOOST_UPLOAD_DECL
    section
    get(string_view name);

    /** Return every section created so far
    */
    BOOST_UPLOAD_DECL
    auto
    get_sections() const ->
        std::vector<section>;

private:
    struct impl;
    impl* impl_;
};

/** Return a process-wide section by name

    The library logs to the sections named
    "upload.file_source" and "upload.file_channel".
*/
BOOST_UPLOAD_DECL
section
get_section(string_view name);

/** Return the process-wide section collection
*/
BOOST_UPLOAD_DECL
log_sections&
get_log_sections();

//------------------------------------------------

#ifndef LOG_AT_LEVEL
#define LOG_AT_LEVEL(sect, level) \
    if(static_cast<int>(level) < (sect).threshold()) {} else sect
#endif

/// Log at trace level
#ifndef LOG_TRC
#define LOG_TRC(sect) LOG_AT_LEVEL(sect, ::boost::upload::log_level::trace)
#endif

/// Log at debug level
#ifndef LOG_DBG
#define LOG_DBG(sect) LOG_AT_LEVEL(sect, ::boost::upload::log_level::debug)
#endif

/// Log at info level (normal)
#ifndef LOG_INF
#define LOG_INF(sect) LOG_AT_LEVEL(sect, ::boost::upload::log_level::info)
#endif

/// Log at warning level
#ifndef LOG_WRN
#define LOG_WRN(sect) LOG_AT_LEVEL(sect, ::boost::upload::log_level::warning)
#endif

/// Log at error level
#ifndef LOG_ERR
#define LOG_ERR(sect) LOG_AT_LEVEL(sect, ::boost::upload::log_level::error)
#endif

} // upload
} // boost

#endif
