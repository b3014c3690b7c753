//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

#ifndef BOOST_UPLOAD_HPP
#define BOOST_UPLOAD_HPP

#include <boost/upload/body_source.hpp>
#include <boost/upload/chunk.hpp>
#include <boost/upload/error.hpp>
#include <boost/upload/file_channel.hpp>
#include <boost/upload/file_source.hpp>
#include <boost/upload/logger.hpp>
#include <boost/upload/memory_source.hpp>
#include <boost/upload/posix_file_channel.hpp>
#include <boost/upload/pull_result.hpp>
#include <boost/upload/readable_stream.hpp>
#include <boost/upload/source_config.hpp>
#include <boost/upload/stream_source.hpp>

#endif
