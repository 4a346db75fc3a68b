#include "TextEncoding.hpp"

namespace a11y {

bool isDrawableCodePoint(unsigned int codePoint) {
  if (codePoint >= 0x110000) {
    return false;
  }
  if (codePoint >= 0xD800 && codePoint <= 0xDFFF) {
    return false;
  }
  if (codePoint >= 0xFDD0 && codePoint <= 0xFDEF) {
    return false;
  }
  return (codePoint & 0xFFFE) != 0xFFFE;
}

void appendUtf8(std::string &s, unsigned int codePoint) {
  if (!isDrawableCodePoint(codePoint)) {
    codePoint = kReplacementCharacter;
  }

  if (codePoint < 0x80) {
    s += static_cast<char>(codePoint);
  } else if (codePoint < 0x800) {
    s += static_cast<char>(0xC0 | (codePoint >> 6));
    s += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else if (codePoint < 0x10000) {
    s += static_cast<char>(0xE0 | (codePoint >> 12));
    s += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    s += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else {
    s += static_cast<char>(0xF0 | (codePoint >> 18));
    s += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
    s += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    s += static_cast<char>(0x80 | (codePoint & 0x3F));
  }
}

bool isDrawableUtf8(const std::string &s) {
  size_t i = 0;
  while (i < s.size()) {
    unsigned char lead = static_cast<unsigned char>(s[i]);
    unsigned int codePoint;
    size_t length;
    unsigned int minimum;

    if (lead < 0x80) {
      codePoint = lead;
      length = 1;
      minimum = 0;
    } else if ((lead & 0xE0) == 0xC0) {
      codePoint = lead & 0x1F;
      length = 2;
      minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      codePoint = lead & 0x0F;
      length = 3;
      minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      codePoint = lead & 0x07;
      length = 4;
      minimum = 0x10000;
    } else {
      return false;
    }

    if (i + length > s.size()) {
      return false;
    }
    for (size_t k = 1; k < length; k++) {
      unsigned char next = static_cast<unsigned char>(s[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      codePoint = (codePoint << 6) | (next & 0x3F);
    }

    if (codePoint < minimum || !isDrawableCodePoint(codePoint)) {
      return false;
    }
    i += length;
  }
  return true;
}

} // namespace a11y
