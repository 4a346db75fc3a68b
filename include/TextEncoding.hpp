#ifndef A11Y_TEXT_ENCODING_HPP
#define A11Y_TEXT_ENCODING_HPP

#include <string>

namespace a11y {

/// U+FFFD, substituted for code points that cannot be drawn
const unsigned int kReplacementCharacter = 0xFFFD;

/**
 * @brief Whether a code point is a Unicode scalar value that text output
 * accepts
 *
 * Surrogates (U+D800-U+DFFF), noncharacters (U+FDD0-U+FDEF and every
 * U+xxFFFE/U+xxFFFF) and values above U+10FFFF are rejected.
 */
bool isDrawableCodePoint(unsigned int codePoint);

/**
 * @brief Append a code point as UTF-8
 *
 * Code points rejected by isDrawableCodePoint() are written as U+FFFD.
 */
void appendUtf8(std::string &s, unsigned int codePoint);

/**
 * @brief Whether a string is well-formed UTF-8 made of drawable code points
 *
 * Truncated sequences, overlong encodings and stray continuation bytes make
 * the string invalid.
 */
bool isDrawableUtf8(const std::string &s);

} // namespace a11y

#endif // A11Y_TEXT_ENCODING_HPP
