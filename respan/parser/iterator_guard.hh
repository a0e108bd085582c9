// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_ITERATOR_GUARD_HH
#define RESPAN_RESPAN_PARSER_ITERATOR_GUARD_HH

#include <defs.hh>

namespace respan::parser {

//
// Rewinds the iterator to where the guard found it, unless the parse
// committed to the input consumed since:
//
template< typename Iterator >
class iterator_guard_t {
public:
    explicit iterator_guard_t (Iterator& iter)
        : iter_ (iter), mark_ (iter)
        { }

    iterator_guard_t (const iterator_guard_t&) = delete;
    iterator_guard_t& operator= (const iterator_guard_t&) = delete;

    ~iterator_guard_t () {
        if (!committed_)
            iter_ = mark_;
    }

    void commit () { committed_ = true; }

private:
    Iterator& iter_;
    const Iterator mark_;
    bool committed_ = false;
};

#define RESPAN_ITERATOR_GUARD(x) iterator_guard_t iterator_guard (x)
#define RESPAN_ITERATOR_RELEASE  iterator_guard.commit ()
#define RESPAN_PARSE_SUCCESS     RESPAN_ITERATOR_RELEASE; return true

} // respan::parser

#endif // RESPAN_RESPAN_PARSER_ITERATOR_GUARD_HH
