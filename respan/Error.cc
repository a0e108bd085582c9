// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdio>
#include <mutex>

#include <respan/Error.hh>

namespace respan {
namespace {

const char* categoryNames [] = {
    "Syntax Warning",
    "Syntax Error",
    "Config Error",
    "Command Line Error",
    "I/O Error",
    "Permission Error",
    "Unimplemented Feature",
    "Internal Error"
};

struct error_sink_t {
    std::mutex mtx;
    error_callback_type callback;
    bool quiet = false;
};

error_sink_t& sink () {
    static error_sink_t instance;
    return instance;
}

} // anonymous

void setErrorCallback (error_callback_type cbk) {
    auto& s = sink ();
    std::lock_guard< std::mutex > lock (s.mtx);
    s.callback = std::move (cbk);
}

void setErrorQuiet (bool quiet) {
    auto& s = sink ();
    std::lock_guard< std::mutex > lock (s.mtx);
    s.quiet = quiet;
}

const char* errorCategoryName (ErrorCategory category) {
    return categoryNames [category];
}

void
verror (ErrorCategory category, off_t pos, fmt::string_view fmt,
        fmt::format_args args) {
    const auto msg = fmt::vformat (fmt, args);

    error_callback_type callback;

    {
        auto& s = sink ();
        std::lock_guard< std::mutex > lock (s.mtx);

        if (!s.callback) {
            if (s.quiet)
                return;

            if (pos >= 0) {
                fmt::print (
                    stderr, "{} ({}): {}\n", categoryNames [category], pos, msg);
            }
            else {
                fmt::print (stderr, "{}: {}\n", categoryNames [category], msg);
            }

            fflush (stderr);
            return;
        }

        callback = s.callback;
    }

    //
    // Outside the lock, the callback may report errors of its own:
    //
    callback (category, pos, msg);
}

} // namespace respan
