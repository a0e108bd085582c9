// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_ATTACK_CHUNK_PLANNER_HH
#define RESPAN_ATTACK_CHUNK_PLANNER_HH

#include <defs.hh>

#include <stdexcept>
#include <string>
#include <vector>

#include <attack/glyph_lookup.hh>

namespace respan::attack {

struct empty_hidden_text_error : std::runtime_error {
    empty_hidden_text_error ()
        : std::runtime_error ("hidden text must not be empty")
    { }
};

//
// What one hidden character renders as:
//
struct attack_position_t {
    size_t index;

    wchar_t hidden;
    std::wstring visual;

    std::vector< std::string > glyph_names;

    //
    // Sum of the visual glyph advances, in font units:
    //
    double advance = 0;

    //
    // Every position needs a derivative font except the one which renders
    // its own character:
    //
    bool requires_font () const {
        return visual.empty () || !(visual.size () == 1 && visual [0] == hidden);
    }

    bool is_zero_width () const { return visual.empty (); }
};

//
// One position per hidden character, in order:
//
using attack_plan_t = std::vector< attack_position_t >;

//
// Distributes the visual text over the hidden characters.
//
class chunk_planner_t {
public:
    explicit chunk_planner_t (const glyph_lookup_t& lookup) : lookup_ (lookup)
    { }

    attack_plan_t
    plan (const std::wstring& hidden, const std::wstring& visual) const;

private:
    attack_plan_t
    plan_hidden_longer (const std::wstring&, const std::wstring&) const;

    attack_plan_t
    plan_visual_longer (const std::wstring&, const std::wstring&) const;

    void append (attack_position_t&, wchar_t) const;

private:
    const glyph_lookup_t& lookup_;
};

} // namespace respan::attack

#endif // RESPAN_ATTACK_CHUNK_PLANNER_HH
