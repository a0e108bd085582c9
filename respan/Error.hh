// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_ERROR_HH
#define RESPAN_RESPAN_ERROR_HH

#include <defs.hh>

#include <cstdio>
#include <functional>
#include <sys/types.h>
#include <string>

#include <fmt/format.h>

namespace respan {

enum ErrorCategory {
    errSyntaxWarning, // PDF or layout syntax error which can be recovered
                      // from, or a recoverable analysis failure
    errSyntaxError,   // PDF or layout syntax error which cannot be recovered
    errConfig,        // error in config file
    errCommandLine,   // error in command line parameters
    errIO,            // error in file I/O
    errNotAllowed,    // operation not allowed
    errUnimplemented, // unimplemented feature
    errInternal       // internal error, malfunction within respan
};

using error_callback_type = std::function<
    void (ErrorCategory, off_t, const std::string&) >;

//
// Replaces the default stderr printer; an empty callback restores it:
//
void setErrorCallback (error_callback_type);

//
// Silences the default printer:
//
void setErrorQuiet (bool);

const char* errorCategoryName (ErrorCategory);

void verror (ErrorCategory, off_t, fmt::string_view, fmt::format_args);

template< typename ... Args >
inline void
error (ErrorCategory category, off_t pos, fmt::string_view fmt,
       const Args& ... args) {
    verror (category, pos, fmt, fmt::make_format_args (args...));
}

} // namespace respan

#endif // RESPAN_RESPAN_ERROR_HH
