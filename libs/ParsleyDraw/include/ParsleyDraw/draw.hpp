#ifndef __PARSLEY_DRAW__
#define __PARSLEY_DRAW__

#include <string>

#include <ParsleyGen/automaton.hpp>
#include <ParsleyGen/grammar.hpp>

namespace parsley {

// Saves the automaton as an SVG image, terminal transitions in blue and
// non-terminal transitions in red
void drawAutomaton(const Grammar &, const Automaton &, const std::string &);

} // namespace parsley

#endif
