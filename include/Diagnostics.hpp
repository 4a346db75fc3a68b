#ifndef A11Y_DIAGNOSTICS_HPP
#define A11Y_DIAGNOSTICS_HPP

#include <ostream>

namespace a11y {

/**
 * @brief Enable or disable DEBUG output on std::cerr
 *
 * Off by default. Error lines are always written to std::cerr; only the
 * DEBUG progress output is controlled here.
 */
void setDebugOutput(bool enabled);

/// Whether DEBUG output is currently enabled
bool debugOutputEnabled();

/**
 * @brief Stream for DEBUG lines
 * @return std::cerr when DEBUG output is enabled, a discarding stream
 * otherwise
 */
std::ostream &debugLog();

} // namespace a11y

#endif // A11Y_DIAGNOSTICS_HPP
