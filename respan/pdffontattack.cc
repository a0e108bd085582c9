// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdio>
#include <exception>
#include <memory>
#include <string>

#include <filesystem>
namespace fs = std::filesystem;

#include <fmt/format.h>

#include <utils/parseargs.hh>
#include <utils/path.hh>
#include <utils/string.hh>

#include <attack/chunk_planner.hh>
#include <attack/font_builder.hh>
#include <attack/font_store.hh>
#include <attack/glyph_lookup.hh>

#include <respan/Error.hh>
#include <respan/params.hh>

using namespace respan;
using namespace respan::attack;

static std::string outDirName;
static std::string cacheDirName;
static std::string cfgFileName;
static bool planOnly = false;
static bool quiet = false;
static bool printVersion = false;
static bool printHelp = false;

static const arg_descs_t argDesc {
    { "-o", &outDirName, "output directory for the derivative fonts" },
    { "-cache", &cacheDirName, "font cache directory" },
    { "-n", &planOnly, "print the plan, don't build any font" },
    { "-cfg", &cfgFileName,
      "configuration file to use in place of .respanrc" },
    { "-q", &quiet, "don't print any messages or errors" },
    { "-v", &printVersion, "print copyright and version info" },
    { "-h", &printHelp, "print usage information" },
    { "-help", &printHelp, "print usage information" },
    { "--help", &printHelp, "print usage information" },
    { "-?", &printHelp, "print usage information" },
};

static void print_plan (const attack_plan_t& plan) {
    fmt::print ("pos hidden font zero advance  visual\n");
    fmt::print ("--- ------ ---- ---- -------- ------\n");

    for (const auto& x : plan) {
        fmt::print ("{:>3} {:<6} {:<4} {:<4} {:>8.1f} '{}'\n",
                    x.index, to_utf8 (x.hidden),
                    x.requires_font () ? "yes" : "no",
                    x.is_zero_width () ? "yes" : "no",
                    x.advance, to_utf8 (x.visual));
    }
}

int main (int argc, char* argv []) {
    bool ok = parse_args (argDesc, argc, argv);

    if (!ok || argc != 4 || printVersion || printHelp) {
        fprintf (stderr, "pdffontattack version %s\n", PACKAGE_VERSION);
        fprintf (stderr, "%s\n", RESPAN_COPYRIGHT);

        if (!printVersion) {
            print_usage (
                "pdffontattack", "<base-font> <hidden> <visual>", argDesc);
        }

        return 99;
    }

    setErrorQuiet (quiet);

    try {
        auto params = load_params (cfgFileName);

        if (!outDirName.empty ())
            params.font_output_dir = expand_path (outDirName);

        if (!cacheDirName.empty ())
            params.font_cache_dir = expand_path (cacheDirName);

        const fs::path base (argv [1]);

        ft_glyph_lookup_t lookup (base);

        const auto plan = chunk_planner_t (lookup).plan (
            from_utf8 (argv [2]), from_utf8 (argv [3]));

        print_plan (plan);

        if (planOnly)
            return 0;

        std::unique_ptr< fs_font_store_t > store;

        if (!params.font_cache_dir.empty ())
            store = std::make_unique< fs_font_store_t > (params.font_cache_dir);

        const auto report = font_builder_t (base, lookup).build_fonts (
            plan, params.font_output_dir, store.get ());

        for (const auto& x : report.results) {
            fmt::print ("{} {}{}\n", x.index, x.path.string (),
                        x.cached ? " (cached)" : "");
        }

        for (const auto& x : report.failures)
            fmt::print ("{} failed: {}\n", x.index, x.message);

        return report.failures.empty () ? 0 : 3;
    }
    catch (const glyph_lookup_error& e) {
        error (errCommandLine, -1, "{}", e.what ());
        return 1;
    }
    catch (const empty_hidden_text_error& e) {
        error (errCommandLine, -1, "{}", e.what ());
        return 1;
    }
    catch (const std::exception& e) {
        error (errIO, -1, "{}", e.what ());
        return 1;
    }
}
