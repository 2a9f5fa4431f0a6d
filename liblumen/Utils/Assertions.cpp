#include "Assertions.h"

#include <liblumen/Platform/Log.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

void lum::detail::on_assertion_failure(
    std::string_view failing_code,
    std::string_view function_name,
    std::string_view file_name,
    unsigned int file_line)
{
    std::stringstream ss;
    ss << file_name << ':' << function_name << ':' << file_line << ": throw_if_not(" << failing_code << "): failed";
    std::string msg = std::move(ss).str();

    log_critical("%s", msg.c_str());
    throw std::runtime_error{std::move(msg)};
}
