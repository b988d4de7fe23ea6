#pragma once
#include <cstdint>
#include <string>

namespace inv::args {

// Command-line value parsers. Each consumes the whole text and returns false
// on anything else, leaving out untouched.

// Non-negative integer that fits in 64 bits (no sign, no exponent).
bool parseCount(const std::string &text, std::uint64_t &out);

bool parseSeed(const std::string &text, std::uint32_t &out);

// Finite, strictly positive length that still fits in a float.
bool parseExtent(const std::string &text, float &out);

} // namespace inv::args
