/**
 * cliapp-demo - Common utilities
 */

#pragma once

#include <cliapp/cliapp.hpp>

#include <iostream>
#include <string>

namespace cliapp::demo {

inline void print_error(const cliapp::Error& error) {
    std::cerr << "Error: " << error.message()
              << " [" << cliapp::error_code_to_string(error.code()) << "]" << std::endl;
}

inline cliapp::Result<void> fail(const std::string& message) {
    return cliapp::Result<void>::err(cliapp::Error(cliapp::ErrorCode::HANDLER_FAILED, message));
}

} // namespace cliapp::demo
