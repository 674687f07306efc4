/*

mime_dump.cpp
-------------

Prints the part tree of a message read from a file or the standard input.

Usage: mime_dump [--smtp] [--trace | --trace-parts] [--chunk N] [file]

The message is fed in chunks of N bytes (4096 by default), so even very large messages are decoded with a small
buffer. With `--smtp` the input is the dot stuffed payload of the DATA command. `--trace` logs every parser event,
`--trace-parts` only the delimiters and the parts found.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <mimexx/mime/message_parser.hpp>
#include "example_util.hpp"


using mimexx::event;
using mimexx::event_type;
using mimexx::message_parser;
using mimexx::parser_options;
using std::cout;
using std::endl;
using std::string;


namespace
{

struct body_stats
{
    std::size_t bytes = 0;
    bool failed = false;
};

void print_begin(const event& ev)
{
    const string indent(ev.depth * 2, ' ');
    const auto& header = *ev.header;
    cout << indent << "+ " << header.content_type.mime_type();
    if (header.multipart)
        cout << " boundary=\"" << header.content_type.boundary() << "\"";
    else
        cout << " (" << mimexx::to_string(header.encoding) << ")";
    if (header.content_disposition.is_attachment())
        cout << " attachment \"" << header.content_disposition.filename() << "\"";
    cout << endl;

    if (ev.depth == 0)
    {
        std::string_view subject = header.headers.value("Subject");
        if (!subject.empty())
            cout << indent << "  Subject: " << subject << endl;
    }
}

/**
Pulling the events available after a feed.

@return False if the parser stopped on a fatal error.
**/
bool pull(message_parser& parser, std::vector<body_stats>& stats)
{
    while (true)
    {
        auto ev = parser.next();
        if (!ev)
        {
            print_error(ev.error());
            return false;
        }

        switch (ev->type)
        {
            case event_type::part_begin:
                print_begin(*ev);
                stats.push_back(body_stats());
                break;

            case event_type::body_data:
                stats.back().bytes += ev->data.size();
                break;

            case event_type::body_error:
                stats.back().failed = true;
                cout << string(ev->depth * 2, ' ') << "  ! " << ev->failure->to_string() << endl;
                break;

            case event_type::part_end:
                if (!stats.empty())
                {
                    if (!stats.back().failed)
                        cout << string(ev->depth * 2, ' ') << "  " << stats.back().bytes << " decoded bytes" << endl;
                    stats.pop_back();
                }
                break;

            case event_type::need_more_input:
            case event_type::end_of_message:
                return true;
        }
    }
}

} // namespace


int main(int argc, char* argv[])
{
    parser_options options;
    std::size_t chunk_size = 4096;
    string path;

    for (int i = 1; i < argc; i++)
    {
        const std::string_view arg = argv[i];
        if (arg == "--smtp")
            options = parser_options::smtp_data();
        else if (arg == "--trace")
        {
            mimexx::log::logger::instance().set_level(mimexx::log::level::trace);
            mimexx::log::logger::instance().set_trace_enabled(true);
        }
        else if (arg == "--trace-parts")
        {
            using mimexx::log::component;
            mimexx::log::logger::instance().set_level(mimexx::log::level::trace);
            mimexx::log::logger::instance().set_trace_components(component::scanner | component::assembler);
        }
        else if (arg == "--chunk" && i + 1 < argc)
            chunk_size = std::strtoul(argv[++i], nullptr, 10);
        else
            path = arg;
    }
    if (chunk_size == 0)
    {
        std::cerr << "Chunk size must be positive." << endl;
        return EXIT_FAILURE;
    }

    std::ifstream file;
    if (!path.empty())
    {
        file.open(path, std::ios::binary);
        if (!file)
        {
            std::cerr << "Cannot open " << path << endl;
            return EXIT_FAILURE;
        }
    }
    std::istream& in = path.empty() ? std::cin : file;

    message_parser parser(options);
    std::vector<body_stats> stats;
    std::vector<char> buffer(chunk_size);
    while (in)
    {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0)
            break;
        auto fed = parser.feed(std::string_view(buffer.data(), got));
        if (!fed)
        {
            print_error(fed.error());
            return EXIT_FAILURE;
        }
        if (!pull(parser, stats))
            return EXIT_FAILURE;
    }

    parser.finish();
    if (!pull(parser, stats))
        return EXIT_FAILURE;
    cout << parser.cursor().position() << " bytes read, peak buffer " << parser.cursor().peak_buffered() << " bytes" << endl;
    return EXIT_SUCCESS;
}
