#include "inv/util/Args.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace inv::args {

bool parseCount(const std::string &text, std::uint64_t &out) {
  if (text.empty())
    return false;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  try {
    out = std::stoull(text);
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

bool parseSeed(const std::string &text, std::uint32_t &out) {
  std::uint64_t v = 0;
  if (!parseCount(text, v) || v > std::numeric_limits<std::uint32_t>::max())
    return false;
  out = static_cast<std::uint32_t>(v);
  return true;
}

bool parseExtent(const std::string &text, float &out) {
  double v = 0.0;
  try {
    std::size_t used = 0;
    v = std::stod(text, &used);
    if (used != text.size())
      return false;
  } catch (const std::exception &) {
    return false;
  }
  if (!std::isfinite(v) || v <= 0.0 || v > std::numeric_limits<float>::max())
    return false;
  out = static_cast<float>(v);
  return true;
}

} // namespace inv::args
