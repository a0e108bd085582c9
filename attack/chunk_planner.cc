// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>

#include <attack/chunk_planner.hh>

#include <utils/string.hh>

namespace respan::attack {

void chunk_planner_t::append (attack_position_t& position, wchar_t c) const {
    position.visual += c;
    position.glyph_names.push_back (lookup_.glyph_name (c));
    position.advance += lookup_.glyph_width (c);
}

attack_plan_t
chunk_planner_t::plan (const std::wstring& hidden,
                       const std::wstring& visual) const {
    if (hidden.empty ())
        throw empty_hidden_text_error ();

    lookup_.ensure_available (hidden + visual);

    if (visual.empty ()) {
        attack_plan_t xs;

        for (size_t i = 0; i < hidden.size (); ++i)
            xs.push_back ({ i, hidden [i] });

        return xs;
    }

    return hidden.size () >= visual.size ()
        ? plan_hidden_longer (hidden, visual)
        : plan_visual_longer (hidden, visual);
}

attack_plan_t
chunk_planner_t::plan_hidden_longer (const std::wstring& hidden,
                                     const std::wstring& visual) const {
    attack_plan_t xs;

    size_t pos = 0;

    for (size_t i = 0; i < hidden.size (); ++i) {
        attack_position_t position{ i, hidden [i] };

        if (is_space (hidden [i])) {
            //
            // White-space renders the white-space next in line, if any;
            // otherwise nothing:
            //
            for (; pos < visual.size () && is_space (visual [pos]); ++pos)
                append (position, visual [pos]);
        }
        else {
            //
            // The white-space in front of the next character goes with it:
            //
            for (; pos < visual.size () && is_space (visual [pos]); ++pos)
                append (position, visual [pos]);

            if (pos < visual.size ())
                append (position, visual [pos++]);
        }

        xs.push_back (std::move (position));
    }

    if (pos < visual.size ()) {
        //
        // Leftovers go after the last rendered or non-blank position, which
        // keeps the visual text in order:
        //
        auto iter = std::find_if (xs.rbegin (), xs.rend (), [](auto& x) {
            return !x.visual.empty () || !is_space (x.hidden);
        });

        auto& position = iter == xs.rend () ? xs.back () : *iter;

        for (; pos < visual.size (); ++pos)
            append (position, visual [pos]);
    }

    return xs;
}

attack_plan_t
chunk_planner_t::plan_visual_longer (const std::wstring& hidden,
                                     const std::wstring& visual) const {
    double total = 0;

    for (auto c : visual)
        total += lookup_.glyph_width (c);

    const auto target = total / hidden.size ();

    attack_plan_t xs;

    size_t pos = 0;

    for (size_t i = 0; i < hidden.size (); ++i) {
        attack_position_t position{ i, hidden [i] };

        const auto slots = hidden.size () - i;

        //
        // Leave at least one character for each of the remaining slots:
        //
        const auto remaining = visual.size () - pos;
        const size_t limit = remaining > slots ? remaining - (slots - 1) : 1;

        for (size_t taken = 0; pos < visual.size () && taken < limit; ++taken) {
            append (position, visual [pos++]);

            if (position.advance >= target &&
                visual.size () - pos >= slots - 1)
                break;
        }

        if (i + 1 == hidden.size ()) {
            while (pos < visual.size ())
                append (position, visual [pos++]);
        }

        xs.push_back (std::move (position));
    }

    return xs;
}

} // namespace respan::attack
