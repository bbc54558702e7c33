// utf8.hpp
// Conversion between the UTF-8 wire form and Unicode scalar values.
// Every position and length in the engine counts scalar values.
#ifndef OT_UTF8_HPP
#define OT_UTF8_HPP

#include "ot_errors.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace utf8 {

/// Decodes UTF-8 into scalar values.
/// @throws InvalidOperation on truncated sequences, overlong forms, surrogates or values past U+10FFFF
inline std::u32string decode(std::string_view in) {
  std::u32string out;
  out.reserve(in.size());

  size_t i = 0;
  while (i < in.size()) {
    unsigned char lead = static_cast<unsigned char>(in[i]);
    char32_t cp;
    size_t extra;
    char32_t min_value;

    if (lead < 0x80) {
      out.push_back(lead);
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      extra = 1;
      min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      extra = 2;
      min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      cp = lead & 0x07;
      extra = 3;
      min_value = 0x10000;
    } else {
      throw InvalidOperation("Invalid UTF-8 lead byte at offset " + std::to_string(i));
    }

    if (i + extra >= in.size()) {
      throw InvalidOperation("Truncated UTF-8 sequence at offset " + std::to_string(i));
    }
    for (size_t k = 1; k <= extra; ++k) {
      unsigned char cont = static_cast<unsigned char>(in[i + k]);
      if ((cont & 0xC0) != 0x80) {
        throw InvalidOperation("Invalid UTF-8 continuation byte at offset " + std::to_string(i + k));
      }
      cp = (cp << 6) | (cont & 0x3F);
    }

    if (cp < min_value) {
      throw InvalidOperation("Overlong UTF-8 sequence at offset " + std::to_string(i));
    }
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      throw InvalidOperation("Invalid Unicode scalar value at offset " + std::to_string(i));
    }

    out.push_back(cp);
    i += extra + 1;
  }
  return out;
}

inline void append(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

/// Encodes scalar values as UTF-8. Input is assumed to hold valid scalars.
inline std::string encode(std::u32string_view in) {
  std::string out;
  out.reserve(in.size());
  for (char32_t cp : in) {
    append(out, cp);
  }
  return out;
}

/// Number of scalar values in a UTF-8 string
/// @throws InvalidOperation if the input is not valid UTF-8
inline uint64_t length(std::string_view in) { return decode(in).size(); }

} // namespace utf8

#endif // OT_UTF8_HPP
