/*

message.cpp
-----------

Decodes a buffered message into its tree: encoded words of the headers, a quoted printable text, a Base64
attachment.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <string>
#include <mimexx/mime/message_parser.hpp>
#include "example_util.hpp"


using mimexx::message;
using mimexx::parse_message;
using mimexx::part;
using std::cout;
using std::endl;
using std::string;


int main()
{
    const string msg_str =
        "From: =?UTF-8?Q?Sylvain_Guin=C3=A9bert?= <contact@example.com>\r\n"
        "To: contact@example.com\r\n"
        "Subject: =?ISO-8859-2?Q?Zdravo,_Sv=E9te!?=\r\n"
        "MIME-Version: 1.0\r\n"
        "Content-Type: multipart/mixed; boundary=\"mimexx-sep\"\r\n"
        "\r\n"
        "This is a multi-part message in MIME format.\r\n"
        "--mimexx-sep\r\n"
        "Content-Type: text/plain; charset=UTF-8\r\n"
        "Content-Transfer-Encoding: quoted-printable\r\n"
        "\r\n"
        "Hello, World! Caf=C3=A9 =\r\n"
        "au lait.\r\n"
        "--mimexx-sep\r\n"
        "Content-Type: application/octet-stream; name=\"hello.txt\"\r\n"
        "Content-Transfer-Encoding: base64\r\n"
        "Content-Disposition: attachment; filename=\"hello.txt\"\r\n"
        "\r\n"
        "SGVsbG8sIFdvcmxkIQ==\r\n"
        "--mimexx-sep--\r\n";

    // Feeding in chunks of 7 bytes gives the same tree as a single chunk.
    message msg = parse_message(msg_str, mimexx::parser_options(), 7);
    if (msg.failed())
    {
        print_error(*msg.error_state());
        return EXIT_FAILURE;
    }

    const auto* subject = msg.headers.find("Subject");
    cout << "Subject charset: " << subject->charset << endl;
    cout << "From: " << msg.headers.value("From") << endl;

    for (const part& p : msg.parts())
    {
        cout << p.content_type.mime_type() << ": ";
        if (p.content_disposition.is_attachment())
            cout << "attachment " << p.content_disposition.filename() << " = ";
        cout << p.content() << endl;
    }

    return EXIT_SUCCESS;
}
