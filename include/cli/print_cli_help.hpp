#pragma once
#include <ostream>

namespace pps {

constexpr const char* kVersion = "0.1.0";

void print_cli_help(std::ostream& out);

} // namespace pps
