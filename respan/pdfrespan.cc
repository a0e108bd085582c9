// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdio>
#include <exception>
#include <fstream>
#include <string>

#include <filesystem>
namespace fs = std::filesystem;

#include <boost/iostreams/device/mapped_file.hpp>
namespace io = boost::iostreams;

#include <fmt/format.h>

#include <utils/parseargs.hh>
#include <utils/string.hh>

#include <respan/Error.hh>
#include <respan/analysis.hh>
#include <respan/content_stream.hh>
#include <respan/layout.hh>
#include <respan/match_planner.hh>
#include <respan/params.hh>
#include <respan/rewrite.hh>

using namespace respan;

static std::string outFileName;
static std::string cfgFileName;
static bool showSpans = false;
static bool quiet = false;
static bool printVersion = false;
static bool printHelp = false;

static const arg_descs_t argDesc {
    { "-o", &outFileName,
      "write the rewritten content stream to this file" },
    { "-spans", &showSpans, "print the per-span rewrite entries" },
    { "-cfg", &cfgFileName,
      "configuration file to use in place of .respanrc" },
    { "-q", &quiet, "don't print any messages or errors" },
    { "-v", &printVersion, "print copyright and version info" },
    { "-h", &printHelp, "print usage information" },
    { "-help", &printHelp, "print usage information" },
    { "--help", &printHelp, "print usage information" },
    { "-?", &printHelp, "print usage information" },
};

static std::string read_file (const fs::path& filepath) {
    if (fs::file_size (filepath) == 0)
        return { };

    io::mapped_file_source src (filepath.string ());
    return std::string (src.data (), src.size ());
}

static void print_plan (const page_analysis_t& analysis,
                        const replacement_plan_t& plan) {
    for (const auto& s : analysis.warnings)
        fmt::print ("page: {}\n", s);

    for (const auto& record : analysis.records)
        for (const auto& s : record.warnings)
            fmt::print ("op {:>4} {:<2} {}\n", record.index, record.name, s);

    fmt::print ("original:    '{}'\n", to_utf8 (plan.original_text));
    fmt::print ("replacement: '{}'\n", to_utf8 (plan.replacement_text));

    fmt::print ("op     role   range      literal  width     text\n");
    fmt::print ("------ ------ ---------- -------- --------- ----\n");

    for (const auto& x : plan.segments) {
        const auto range = fmt::format ("{}-{}", x.local_start, x.local_end);

        fmt::print ("{:>6} {:<6} {:<10} {:<8} {:>9.3f} '{}'",
                    x.operator_index, name_of (x.role), range,
                    name_of (x.literal_kind), x.width, to_utf8 (x.text));

        if (x.role == segment_role_t::match) {
            fmt::print (" -> '{}'{}", to_utf8 (x.planned_text),
                        x.requires_isolation ? " (isolated)" : "");
        }

        fmt::print ("\n");
    }
}

static void print_spans (size_t page, const params_t& params,
                         const replacement_plan_t& plan) {
    span_accumulators_t accumulators;
    accumulate_plan (accumulators, plan, params.min_horizontal_scale);

    auto measure = [&](const std::wstring& s, const std::string&, double size) {
        return double (s.size ()) * size * params.naive_glyph_width;
    };

    for (auto& [key, accumulator] : accumulators) {
        const auto& [block, line, span] = key;

        if (const auto entry = accumulator.build_entry (page, measure)) {
            fmt::print ("span {}/{}/{}: '{}' -> '{}' scale {:.3f}{}\n",
                        block, line, span, to_utf8 (entry->original_text),
                        to_utf8 (entry->replacement_text), entry->scale,
                        entry->overlay_fallback ? " (overlay)" : "");
        }

        for (const auto& x : accumulator.failures ()) {
            fmt::print ("span {}/{}/{}: expected '{}', found '{}'\n",
                        block, line, span, to_utf8 (x.expected),
                        to_utf8 (x.observed));
        }
    }
}

int main (int argc, char* argv []) {
    bool ok = parse_args (argDesc, argc, argv);

    if (!ok || argc != 5 || printVersion || printHelp) {
        fprintf (stderr, "pdfrespan version %s\n", PACKAGE_VERSION);
        fprintf (stderr, "%s\n", RESPAN_COPYRIGHT);

        if (!printVersion) {
            print_usage (
                "pdfrespan",
                "<content-stream> <layout> <target> <replacement>", argDesc);
        }

        return 99;
    }

    setErrorQuiet (quiet);

    try {
        const auto params = load_params (cfgFileName);

        const auto ops = parse_content_stream (read_file (argv [1]));
        const auto layout = read_page_layout (fs::path (argv [2]));

        const auto analysis = analyze_page (ops, layout, params);

        const auto plan = build_replacement_plan (
            layout.index, from_utf8 (argv [3]), from_utf8 (argv [4]),
            analysis.records, analysis.alignment);

        print_plan (analysis, plan);

        if (showSpans)
            print_spans (layout.index, params, plan);

        if (!outFileName.empty ()) {
            std::ofstream out (outFileName, std::ios::binary);
            out << write_content_stream (
                apply_plan (ops, analysis.records, plan));

            if (!out) {
                error (errIO, -1, "Couldn't write to '{}'", outFileName);
                return 2;
            }
        }
    }
    catch (const match_not_found_error& e) {
        error (errCommandLine, -1, "{}", e.what ());
        return 1;
    }
    catch (const std::exception& e) {
        error (errIO, -1, "{}", e.what ());
        return 1;
    }

    return 0;
}
