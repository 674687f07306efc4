#pragma once

#include <iostream>
#include <mimexx/detail/result.hpp>

inline void print_error(const mimexx::error& err)
{
    std::cerr << "Error: " << mimexx::error_code_to_string(err.code()) << " - " << err.message() << "\n";
    std::cerr << "Offset: " << err.offset() << "\n";
}
