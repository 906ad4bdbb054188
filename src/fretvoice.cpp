/**
 * @file fretvoice.cpp
 * @brief Library version.
 */

#include "fretvoice.h"

namespace fretvoice {

const char* version() {
  return "1.0.0";
}

}  // namespace fretvoice
