#include "cli/ask.hpp"

#include <string>

#include "pps_types.hpp"

namespace pps {

std::string ask(std::istream& in, std::ostream& out, const std::string& q, const std::string& def) {
  out << q;
  if (!def.empty())
    out << " [" << def << "]";
  out << " " << std::flush;
  std::string s;
  if (!std::getline(in, s))
    throw ProfileError(ProfileErrc::Io, "Input ended while waiting for: " + q);
  auto first = s.find_first_not_of(" \t\r");
  s = (first == std::string::npos) ? "" : s.substr(first, s.find_last_not_of(" \t\r") - first + 1);
  if (s.empty())
    return def;
  return s;
}

} // namespace pps
