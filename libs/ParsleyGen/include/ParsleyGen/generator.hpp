#ifndef __PARSLEY_GEN_GENERATOR__
#define __PARSLEY_GEN_GENERATOR__

#include <iostream>

#include "automaton.hpp"
#include "grammar.hpp"
#include "lrtable.hpp"
#include "symbol_sets.hpp"

namespace parsley {

// One run of the pipeline over a grammar, which must outlive the generator
class LRGenerator {
public:
  explicit LRGenerator(const Grammar &, LookaheadPolicy policy = SLR1);
  LRGenerator(const Grammar &&, LookaheadPolicy policy = SLR1) = delete;

  const Grammar &getGrammar() const;
  const SymbolSets &getSymbolSets() const;
  const Automaton &getAutomaton() const;
  const LRParseTable &getParseTable() const;
  bool isParseable() const;

  void printReport(std::ostream &out = std::cout) const;

private:
  const Grammar &grammar;
  SymbolSets symbol_sets;
  Automaton automaton;
  LRParseTable parse_table;
};

} // namespace parsley

#endif
