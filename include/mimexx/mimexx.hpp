#pragma once

#include <mimexx/export.hpp>
#include <mimexx/config.hpp>

#include <mimexx/codec/base64.hpp>
#include <mimexx/codec/base64_stream.hpp>
#include <mimexx/codec/codec.hpp>
#include <mimexx/codec/percent.hpp>
#include <mimexx/codec/q_codec.hpp>
#include <mimexx/codec/quoted_printable.hpp>
#include <mimexx/codec/transfer_decoder.hpp>

#include <mimexx/stream/input_cursor.hpp>

#include <mimexx/mime/boundary_scanner.hpp>
#include <mimexx/mime/content_type.hpp>
#include <mimexx/mime/header.hpp>
#include <mimexx/mime/header_parser.hpp>
#include <mimexx/mime/message_parser.hpp>
#include <mimexx/mime/parser_options.hpp>
#include <mimexx/mime/part.hpp>
#include <mimexx/mime/part_assembler.hpp>

// Utilities
#include <mimexx/detail/log.hpp>
#include <mimexx/detail/result.hpp>
