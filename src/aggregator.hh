#ifndef aggregator_hh_INCLUDED
#define aggregator_hh_INCLUDED

#include "array_view.hh"
#include "candidate.hh"
#include "optional.hh"

namespace Tabgrid
{

// Longest common extension of the candidate lines beyond what is typed
// before the cursor. Returns a candidate holding the extended line when
// every candidate agrees on at least one more character, nothing otherwise.
Optional<Candidate> aggregate(StringView source_line, CharCount cursor_pos,
                              ConstArrayView<Candidate> candidates);

}

#endif // aggregator_hh_INCLUDED
