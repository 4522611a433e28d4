#ifndef __PARSLEY_DEMO__
#define __PARSLEY_DEMO__

#include <ParsleyGen/grammar.hpp>

// E := E * B | E + B | B
// B := 0 | 1
parsley::Grammar demoGrammar();

#endif
