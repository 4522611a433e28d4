#include "ParsleyGen/generator.hpp"

namespace parsley {

LRGenerator::LRGenerator(const Grammar &grammar, LookaheadPolicy policy)
    : grammar(grammar), symbol_sets(grammar), automaton(grammar),
      parse_table(grammar, automaton, symbol_sets, policy) {}

const Grammar &LRGenerator::getGrammar() const { return this->grammar; }

const SymbolSets &LRGenerator::getSymbolSets() const {
  return this->symbol_sets;
}

const Automaton &LRGenerator::getAutomaton() const { return this->automaton; }

const LRParseTable &LRGenerator::getParseTable() const {
  return this->parse_table;
}

bool LRGenerator::isParseable() const {
  return this->parse_table.isParseable();
}

void LRGenerator::printReport(std::ostream &out) const {
  out << "Grammar" << std::endl;
  this->grammar.printGrammar(out);

  out << "Symbol sets" << std::endl;
  this->symbol_sets.printSymbolSets(out);

  out << "States" << std::endl;
  this->automaton.printStates(out);

  out << (this->parse_table.getLookaheadPolicy() == SLR1 ? "SLR(1)" : "LR(0)")
      << " parse table" << std::endl;
  this->parse_table.printParseTable(out);
  this->parse_table.printConflicts(out);
}

} // namespace parsley
