// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RESPAN_CONFIG_HH
#define RESPAN_CONFIG_HH

// Autoconf-like macros
#define PACKAGE "respan"
#define PACKAGE_NAME "respan"
#define PACKAGE_STRING "respan 0.4.0"
#define PACKAGE_TARNAME "respan"
#define PACKAGE_URL ""
#define PACKAGE_VERSION "0.4.0"
#define VERSION "0.4.0"

#define RESPAN_COPYRIGHT "Copyright 2020- Thinkoid, LLC"

//------------------------------------------------------------------------
// defaults for the analysis parameters
//------------------------------------------------------------------------

// shortest operator-text prefix the span aligner will retry with
#define RESPAN_ALIGN_MIN_LENGTH 16

// maximum tolerated distance (in points) between a resolved advance and the
// matrix delta it produces
#define RESPAN_DRIFT_TOLERANCE 0.5

// naive advance estimate, per glyph, in units of the font size
#define RESPAN_NAIVE_GLYPH_WIDTH 0.5

// legibility floor for the horizontal scale of a rewritten span
#define RESPAN_MIN_HORIZONTAL_SCALE 0.01

// name of the configuration file looked up in the home directory
#define RESPAN_RC_FILE ".respanrc"

#endif // RESPAN_CONFIG_HH
