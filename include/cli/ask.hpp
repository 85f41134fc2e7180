#pragma once
#include <istream>
#include <ostream>
#include <string>

namespace pps {

// Print `q` (and the default in brackets, if any) to `out` and read one line, trimmed of surrounding blanks,
// from `in`. An empty answer yields `def`. Throws ProfileError(Io) when the
// input ends before a line is read.
std::string ask(std::istream& in, std::ostream& out, const std::string& q, const std::string& def = "");

} // namespace pps
