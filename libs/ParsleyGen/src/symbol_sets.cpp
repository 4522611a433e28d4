#include "ParsleyGen/symbol_sets.hpp"

namespace parsley {

SymbolSets::SymbolSets(const Grammar &grammar)
    : grammar(grammar), nullable(grammar.getNonTerminalCount(), false),
      first_sets(grammar.getNonTerminalCount()),
      follow_sets(grammar.getNonTerminalCount()) {
  do {
    this->nullable_passes++;
  } while (this->nullablePass());

  do {
    this->first_passes++;
  } while (this->firstPass());

  // $ follows the augmented start symbol, and so the start symbol
  this->follow_sets[grammar.getAugmentedStartSymbol().id].insert(END_OF_INPUT);
  do {
    this->follow_passes++;
  } while (this->followPass());
}

bool SymbolSets::nullablePass() {
  bool changed = false;
  for (auto const &[head, rhs, _] : this->grammar.getProductions()) {
    if (this->nullable[head.id])
      continue;

    bool all_nullable = true;
    for (Symbol symbol : rhs)
      all_nullable &= this->isNullable(symbol);

    if (all_nullable) {
      this->nullable[head.id] = true;
      changed = true;
    }
  }
  return changed;
}

bool SymbolSets::firstPass() {
  bool changed = false;
  for (auto const &[head, rhs, _] : this->grammar.getProductions()) {
    std::set<uint32_t> &first = this->first_sets[head.id];
    std::size_t before = first.size();

    for (Symbol symbol : rhs) {
      if (symbol.kind == TERM) {
        first.insert(symbol.id);
        break;
      }
      // FIRST(head) may be FIRST(symbol) itself, so copy before inserting
      std::set<uint32_t> to_append = this->first_sets[symbol.id];
      first.insert(to_append.begin(), to_append.end());
      if (!this->nullable[symbol.id])
        break;
    }
    changed |= first.size() != before;
  }
  return changed;
}

bool SymbolSets::followPass() {
  bool changed = false;
  for (auto const &[head, rhs, _] : this->grammar.getProductions()) {
    for (std::size_t i = 0; i < rhs.size(); i++) {
      if (rhs[i].kind != NON_TERM)
        continue;

      std::set<uint32_t> &follow = this->follow_sets[rhs[i].id];
      std::size_t before = follow.size();

      auto [rest_first, rest_nullable] = this->getFirstSet(rhs, i + 1);
      follow.insert(rest_first.begin(), rest_first.end());
      if (rest_nullable) {
        std::set<uint32_t> to_append = this->follow_sets[head.id];
        follow.insert(to_append.begin(), to_append.end());
      }
      changed |= follow.size() != before;
    }
  }
  return changed;
}

bool SymbolSets::isNullable(Symbol symbol) const {
  return symbol.kind == NON_TERM && this->nullable.at(symbol.id);
}

std::set<uint32_t> SymbolSets::getFirstSet(Symbol symbol) const {
  if (symbol.kind == TERM)
    return {symbol.id};
  return this->first_sets.at(symbol.id);
}

std::pair<std::set<uint32_t>, bool>
SymbolSets::getFirstSet(const std::vector<Symbol> &rhs,
                        std::size_t from) const {
  std::set<uint32_t> first;
  for (std::size_t i = from; i < rhs.size(); i++) {
    if (rhs[i].kind == TERM) {
      first.insert(rhs[i].id);
      return {first, false};
    }
    const std::set<uint32_t> &symbol_first = this->first_sets.at(rhs[i].id);
    first.insert(symbol_first.begin(), symbol_first.end());
    if (!this->nullable[rhs[i].id])
      return {first, false};
  }
  return {first, true};
}

const std::set<uint32_t> &SymbolSets::getFollowSet(uint32_t non_term) const {
  return this->follow_sets.at(non_term);
}

std::size_t SymbolSets::getNullablePasses() const {
  return this->nullable_passes;
}

std::size_t SymbolSets::getFirstPasses() const { return this->first_passes; }

std::size_t SymbolSets::getFollowPasses() const { return this->follow_passes; }

bool SymbolSets::isFixpoint() const {
  SymbolSets again = *this;
  return !again.nullablePass() && !again.firstPass() && !again.followPass();
}

void SymbolSets::printSet(const std::set<uint32_t> &set,
                          std::ostream &out) const {
  out << "{";
  bool first = true;
  for (uint32_t term : set) {
    out << (first ? " " : ", ")
        << this->grammar.symbolToString(Symbol{TERM, term});
    first = false;
  }
  out << " }";
}

void SymbolSets::printSymbolSets(std::ostream &out) const {
  for (uint32_t nt = 0; nt < this->grammar.getNonTerminalCount(); nt++) {
    out << this->grammar.symbolToString(Symbol{NON_TERM, nt});
    if (this->nullable[nt])
      out << " (nullable)";
    out << "\n  FIRST  = ";
    this->printSet(this->first_sets[nt], out);
    out << "\n  FOLLOW = ";
    this->printSet(this->follow_sets[nt], out);
    out << "\n";
  }
  out << std::endl;
}

} // namespace parsley
