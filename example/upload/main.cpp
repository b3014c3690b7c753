//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/upload
//

// Drives a body source the way an HTTP transport would:
// pull a write-sized piece, send it, and park on retry_later
// until the source says more bytes are ready.

#include <boost/upload.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/program_options.hpp>
#include <boost/system/system_error.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

namespace po = boost::program_options;

namespace boost {
namespace upload {

namespace {

log_level
parse_level(std::string const& s)
{
    if(s == "trace") return log_level::trace;
    if(s == "debug") return log_level::debug;
    if(s == "info") return log_level::info;
    if(s == "warning") return log_level::warning;
    if(s == "error") return log_level::error;
    if(s == "off") return log_level::off;
    throw po::validation_error(
        po::validation_error::invalid_option_value,
        "log-level", s);
}

std::size_t
parse_threads(std::size_t n)
{
    if(n == 0)
        throw po::validation_error(
            po::validation_error::invalid_option_value,
            "threads", "0");
    return n;
}

// Stands in for the socket of a transport
class transport
{
public:
    transport(
        body_source& src,
        std::ostream& out,
        std::size_t write_size)
        : src_(src)
        , out_(out)
        , write_size_(write_size)
    {
    }

    // Send until the source stalls or ends
    void
    resume()
    {
        for(;;)
        {
            auto r = src_.pull(write_size_);
            if(r.has_data())
            {
                out_.write(r.bytes().data(),
                    static_cast<std::streamsize>(r.bytes().size()));
                sent_ += r.bytes().size();
                continue;
            }
            if(r.is_retry_later())
            {
                ++stalls_;
                return;
            }
            ended_ = true;
            ec_ = r.error();
            return;
        }
    }

    bool ended() const noexcept { return ended_; }
    std::uint64_t sent() const noexcept { return sent_; }
    std::size_t stalls() const noexcept { return stalls_; }
    system::error_code error() const noexcept { return ec_; }

private:
    body_source& src_;
    std::ostream& out_;
    std::size_t write_size_;
    std::uint64_t sent_ = 0;
    std::size_t stalls_ = 0;
    bool ended_ = false;
    system::error_code ec_;
};

int
run_upload(po::variables_map const& vm)
{
    source_config cfg;
    cfg.max_write_size = vm["write-size"].as<std::size_t>();
    cfg.buffer_multiple = vm["buffer-multiple"].as<std::size_t>();
    cfg.validate();

    auto const level = parse_level(
        vm["log-level"].as<std::string>());
    get_section("upload.file_source").set_threshold(level);
    get_section("upload.file_channel").set_threshold(level);

    auto const path = vm["input"].as<std::string>();
    auto const kind = vm["source"].as<std::string>();

    std::ofstream ofs;
    std::ostream* out = &std::cout;
    if(vm.count("output"))
    {
        ofs.open(vm["output"].as<std::string>(),
            std::ios::binary);
        if(! ofs)
        {
            std::cerr << "cannot open output" << std::endl;
            return EXIT_FAILURE;
        }
        out = &ofs;
    }

    asio::io_context ioc;
    asio::thread_pool pool(parse_threads(
        vm["threads"].as<std::size_t>()));
    auto wg = asio::make_work_guard(ioc);

    std::unique_ptr<body_source> src;
    std::unique_ptr<transport> tp;
    std::ifstream ifs;

    if(kind == "file")
    {
        src.reset(new file_source(
            ioc.get_executor(),
            pool.get_executor(),
            path,
            [&]
            {
                tp->resume();
                if(tp->ended())
                    wg.reset();
            },
            cfg));
    }
    else if(kind == "stream")
    {
        ifs.open(path, std::ios::binary);
        if(! ifs)
        {
            std::cerr << "cannot open " << path << std::endl;
            return EXIT_FAILURE;
        }
        src.reset(new stream_source(
            std::unique_ptr<readable_stream>(
                new istream_readable(ifs))));
    }
    else if(kind == "memory")
    {
        ifs.open(path, std::ios::binary);
        if(! ifs)
        {
            std::cerr << "cannot open " << path << std::endl;
            return EXIT_FAILURE;
        }
        std::string s(
            (std::istreambuf_iterator<char>(ifs)),
            std::istreambuf_iterator<char>());
        src.reset(new memory_source(
            make_chunk(std::move(s))));
    }
    else
    {
        std::cerr << "unknown source: " << kind << std::endl;
        return EXIT_FAILURE;
    }

    if(src->has_size())
        std::cerr << "size: " << src->size() << std::endl;

    tp.reset(new transport(*src, *out, cfg.max_write_size));
    tp->resume();
    if(tp->ended())
        wg.reset();
    ioc.run();
    pool.join();

    out->flush();
    std::cerr <<
        "sent: " << tp->sent() <<
        ", stalls: " << tp->stalls() << std::endl;
    if(tp->error().failed())
    {
        std::cerr << "error: " << tp->error().message() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // (anon)

} // upload
} // boost

int
main(int argc, char* argv[])
{
    try
    {
        auto odesc = po::options_description{ "Options" };
        // clang-format off
        odesc.add_options()
            ("buffer-multiple",
                po::value<std::size_t>()->value_name("<num>")->default_value(
                    BOOST_UPLOAD_BUFFER_MULTIPLE),
                "Read-ahead target as a multiple of the write size")
            ("help,h", "produce help message")
            ("input",
                po::value<std::string>()->value_name("<file>")->required(),
                "File to upload")
            ("log-level",
                po::value<std::string>()->value_name("<level>")->default_value("warning"),
                "trace, debug, info, warning, error or off")
            ("output,o",
                po::value<std::string>()->value_name("<file>"),
                "Write the body to file instead of stdout")
            ("source",
                po::value<std::string>()->value_name("<kind>")->default_value("file"),
                "Body source to use: file, stream or memory")
            ("threads",
                po::value<std::size_t>()->value_name("<num>")->default_value(1),
                "Threads performing file reads")
            ("write-size",
                po::value<std::size_t>()->value_name("<bytes>")->default_value(
                    BOOST_UPLOAD_MAX_WRITE_SIZE),
                "Bytes sent per write");
        // clang-format on

        po::positional_options_description pdesc;
        pdesc.add("input", 1);

        po::variables_map vm;
        po::store(
            po::command_line_parser{ argc, argv }
                .options(odesc)
                .positional(pdesc)
                .run(),
            vm);

        if(vm.count("help") || argc == 1)
        {
            std::cerr
                << "Usage: upload [options...] <file>\n"
                << odesc;
            return EXIT_SUCCESS;
        }
        po::notify(vm);

        return boost::upload::run_upload(vm);
    }
    catch(boost::system::system_error const& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch(std::exception const& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
