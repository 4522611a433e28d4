#include <algorithm>
#include <cstdio>
#include <stdexcept>

#include "ParsleyGen/lrtable.hpp"

namespace parsley {

std::string actionToString(ParseAction action) {
  switch (action.kind) {
  case SHIFT:
    return "S" + std::to_string(action.value);
  case REDUCE:
    return "R" + std::to_string(action.value);
  case ACCEPT:
    return "acc";
  case EMPTY:
    break;
  }
  return "";
}

std::string conflictKindToString(ConflictKind kind) {
  switch (kind) {
  case SHIFT_REDUCE:
    return "shift/reduce";
  case ACCEPT_REDUCE:
    return "accept/reduce";
  case REDUCE_REDUCE:
    break;
  }
  return "reduce/reduce";
}

LRParseTable::LRParseTable(const Grammar &grammar, const Automaton &automaton,
                           const SymbolSets &symbol_sets,
                           LookaheadPolicy policy)
    : grammar(grammar), policy(policy),
      state_count(automaton.getStateCount()),
      terms(grammar.getTerminalCount()),
      nonterms(grammar.getNonTerminalCount()),
      action_table(state_count * terms, ParseAction{EMPTY, 0}),
      goto_table(state_count * nonterms, -1) {
  this->fillTables(automaton, symbol_sets);
}

void LRParseTable::setAction(uint32_t state, uint32_t term,
                             ParseAction action) {
  ParseAction &cell = this->action_table[state * this->terms + term];
  if (cell.kind == EMPTY) {
    cell = action;
    return;
  }
  if (cell == action)
    return;

  // Keep the first action and remember every other one
  auto [entry, _] = this->conflict_cells.try_emplace(
      {state, term}, Conflict{state, term, REDUCE_REDUCE, {cell}});
  std::vector<ParseAction> &actions = entry->second.actions;
  if (std::find(actions.begin(), actions.end(), action) == actions.end())
    actions.push_back(action);

  ConflictKind kind = REDUCE_REDUCE;
  for (const ParseAction &competing : actions) {
    if (competing.kind == SHIFT)
      kind = SHIFT_REDUCE;
    else if (competing.kind == ACCEPT && kind != SHIFT_REDUCE)
      kind = ACCEPT_REDUCE;
  }
  entry->second.kind = kind;
}

void LRParseTable::fillTables(const Automaton &automaton,
                              const SymbolSets &symbol_sets) {
  const uint32_t augmented_rule = this->grammar.getAugmentedProduction();

  for (uint32_t state = 0; state < this->state_count; state++) {
    const LRState &items = automaton.getState(state);

    // Shift actions
    for (const Item &item : items) {
      std::optional<Symbol> next = expectingSymbol(this->grammar, item);
      if (!next.has_value() || next->kind != TERM)
        continue;

      int shift_state = automaton.getTransition(state, next.value());
      if (shift_state >= 0)
        this->setAction(state, next->id,
                        ParseAction{SHIFT, static_cast<uint32_t>(shift_state)});
    }

    // Accept action
    for (const Item &item : items) {
      if (item.production == augmented_rule &&
          isComplete(this->grammar, item)) {
        this->setAction(state, END_OF_INPUT, ParseAction{ACCEPT, 0});
        this->accept_state = state;
      }
    }

    // Reduce actions
    for (const Item &item : items) {
      if (item.production == augmented_rule ||
          !isComplete(this->grammar, item))
        continue;

      ParseAction reduce{REDUCE, item.production};
      if (this->policy == SLR1) {
        Symbol head = this->grammar.getProduction(item.production).lhs;
        for (uint32_t term : symbol_sets.getFollowSet(head.id))
          this->setAction(state, term, reduce);
      } else {
        for (uint32_t term = 0; term < this->terms; term++)
          this->setAction(state, term, reduce);
      }
    }

    // Goto entries
    for (const auto &[symbol, goto_state] : automaton.getTransitions(state)) {
      if (symbol.kind == NON_TERM)
        this->goto_table[state * this->nonterms + symbol.id] = goto_state;
    }
  }

  for (auto &[cell, conflict] : this->conflict_cells)
    this->conflicts.push_back(std::move(conflict));
  this->conflict_cells.clear();
}

ParseAction LRParseTable::getAction(uint32_t state, uint32_t term) const {
  if (state >= this->state_count || term >= this->terms)
    throw std::out_of_range("action table cell out of range");
  return this->action_table[state * this->terms + term];
}

int LRParseTable::getGoto(uint32_t state, uint32_t nonterm) const {
  if (state >= this->state_count || nonterm >= this->nonterms)
    throw std::out_of_range("goto table cell out of range");
  return this->goto_table[state * this->nonterms + nonterm];
}

uint32_t LRParseTable::getStateCount() const { return this->state_count; }

uint32_t LRParseTable::getAcceptState() const { return this->accept_state; }

std::size_t LRParseTable::getProductionCount() const {
  return this->grammar.getProductionCount();
}

const Production &LRParseTable::getProduction(std::size_t rule) const {
  return this->grammar.getProduction(rule);
}

LookaheadPolicy LRParseTable::getLookaheadPolicy() const {
  return this->policy;
}

const std::vector<Conflict> &LRParseTable::getConflicts() const {
  return this->conflicts;
}

bool LRParseTable::isParseable() const { return this->conflicts.empty(); }

void LRParseTable::printParseTable(std::ostream &out) const {
  char cell[64];
  // The augmented start symbol never labels a goto
  uint32_t goto_columns = this->nonterms - 1;

  std::snprintf(cell, sizeof(cell), "%5s | ", "state");
  out << cell;
  for (uint32_t t_id = 0; t_id < this->terms; t_id++) {
    std::snprintf(cell, sizeof(cell), "%-6s ",
                  this->grammar.getTerminalString(t_id).c_str());
    out << cell;
  }
  out << " | ";
  for (uint32_t nt_id = 0; nt_id < goto_columns; nt_id++) {
    std::snprintf(cell, sizeof(cell), "%-6s ",
                  this->grammar.getNonTerminalString(nt_id).c_str());
    out << cell;
  }
  out << "\n";

  for (uint32_t i = 0; i < 11 + 7 * (this->terms + goto_columns); i++)
    out << "-";
  out << "\n";

  for (uint32_t state = 0; state < this->state_count; state++) {
    std::snprintf(cell, sizeof(cell), "%5u | ", state);
    out << cell;
    for (uint32_t t_id = 0; t_id < this->terms; t_id++) {
      std::snprintf(cell, sizeof(cell), "%-6s ",
                    actionToString(this->getAction(state, t_id)).c_str());
      out << cell;
    }
    out << " | ";
    for (uint32_t nt_id = 0; nt_id < goto_columns; nt_id++) {
      int goto_state = this->getGoto(state, nt_id);
      if (goto_state == -1)
        std::snprintf(cell, sizeof(cell), "%6s ", "");
      else
        std::snprintf(cell, sizeof(cell), "%-6d ", goto_state);
      out << cell;
    }
    out << "\n";
  }
  out << std::endl;
}

void LRParseTable::printConflicts(std::ostream &out) const {
  if (this->conflicts.empty()) {
    out << "No conflicts" << std::endl;
    return;
  }

  for (const Conflict &conflict : this->conflicts) {
    out << "state " << conflict.state << " on "
        << this->grammar.symbolToString(Symbol{TERM, conflict.terminal})
        << ": "
        << conflictKindToString(conflict.kind) << " conflict between";
    for (std::size_t i = 0; i < conflict.actions.size(); i++)
      out << (i == 0 ? " " : ", ") << actionToString(conflict.actions[i]);
    out << "\n";
  }
  out << std::endl;
}

} // namespace parsley
