/**
 * @file fretvoice.h
 * @brief Umbrella header for the fretvoice library.
 */

#ifndef FRETVOICE_H
#define FRETVOICE_H

#include "core/chord.h"
#include "core/pitch_class.h"
#include "instrument/fretted/capo_suggester.h"
#include "instrument/fretted/difficulty_model.h"
#include "instrument/fretted/instrument.h"
#include "instrument/fretted/voicing.h"
#include "instrument/fretted/voicing_search.h"
#include "instrument/fretted/voicing_sequencer.h"

namespace fretvoice {

/// @brief Library version string.
const char* version();

}  // namespace fretvoice

#endif  // FRETVOICE_H
