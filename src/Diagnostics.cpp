#include "Diagnostics.hpp"

#include <iostream>
#include <streambuf>

namespace a11y {

namespace {

class NullBuffer : public std::streambuf {
protected:
  int overflow(int c) override { return c; }
};

NullBuffer nullBuffer;
std::ostream nullStream(&nullBuffer);
bool debugEnabled = false;

} // anonymous namespace

void setDebugOutput(bool enabled) { debugEnabled = enabled; }

bool debugOutputEnabled() { return debugEnabled; }

std::ostream &debugLog() {
  if (debugEnabled) {
    return std::cerr;
  }
  return nullStream;
}

} // namespace a11y
