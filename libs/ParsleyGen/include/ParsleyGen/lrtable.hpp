#ifndef __PARSLEY_GEN_LRTABLE__
#define __PARSLEY_GEN_LRTABLE__

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "automaton.hpp"
#include "grammar.hpp"
#include "symbol_sets.hpp"

namespace parsley {

enum ParseActionKind { EMPTY, SHIFT, REDUCE, ACCEPT };

struct ParseAction {
  ParseActionKind kind;
  // State to shift to, or rule to reduce by
  uint32_t value;

  bool operator==(ParseAction const &other) const {
    return this->kind == other.kind && this->value == other.value;
  }
  bool operator!=(ParseAction const &other) const { return !(*this == other); }
};

std::string actionToString(ParseAction);

// SHIFT_REDUCE if any competing action is a shift, ACCEPT_REDUCE if the
// augmented start item competes with a reduction, REDUCE_REDUCE otherwise
enum ConflictKind { SHIFT_REDUCE, ACCEPT_REDUCE, REDUCE_REDUCE };

struct Conflict {
  uint32_t state;
  uint32_t terminal;
  ConflictKind kind;
  // Every competing action, the one kept in the table first
  std::vector<ParseAction> actions;
};

std::string conflictKindToString(ConflictKind);

// Terminals a complete item reduces on: FOLLOW of its head for SLR(1), every
// terminal for LR(0)
enum LookaheadPolicy { LR0, SLR1 };

// What a driver needs to run the shift/reduce loop
class ParseTable {
public:
  virtual ParseAction getAction(uint32_t, uint32_t) const = 0;
  virtual int getGoto(uint32_t, uint32_t) const = 0;
  virtual uint32_t getStateCount() const = 0;
  virtual uint32_t getAcceptState() const = 0;
  virtual std::size_t getProductionCount() const = 0;
  virtual const Production &getProduction(std::size_t) const = 0;
  virtual ~ParseTable() = default;
};

class LRParseTable : public ParseTable {
public:
  LRParseTable(const Grammar &, const Automaton &, const SymbolSets &,
               LookaheadPolicy policy = SLR1);
  LRParseTable(const Grammar &&, const Automaton &, const SymbolSets &,
               LookaheadPolicy policy = SLR1) = delete;

  ParseAction getAction(uint32_t, uint32_t) const override;
  int getGoto(uint32_t, uint32_t) const override;
  uint32_t getStateCount() const override;
  uint32_t getAcceptState() const override;
  std::size_t getProductionCount() const override;
  const Production &getProduction(std::size_t) const override;

  LookaheadPolicy getLookaheadPolicy() const;
  const std::vector<Conflict> &getConflicts() const;
  // A table with conflicts must not be handed to a driver
  bool isParseable() const;

  void printParseTable(std::ostream &out = std::cout) const;
  void printConflicts(std::ostream &out = std::cout) const;

private:
  const Grammar &grammar;
  LookaheadPolicy policy;

  uint32_t state_count;
  uint32_t terms;
  uint32_t nonterms;
  uint32_t accept_state = 0;

  std::vector<ParseAction> action_table;
  std::vector<int> goto_table;

  std::vector<Conflict> conflicts;
  // Conflicts by (state, terminal) while the tables are being filled
  std::map<std::pair<uint32_t, uint32_t>, Conflict> conflict_cells;

  void fillTables(const Automaton &, const SymbolSets &);
  void setAction(uint32_t, uint32_t, ParseAction);
};

} // namespace parsley

#endif
