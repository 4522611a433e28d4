#include <algorithm>
#include <deque>

#include "ParsleyGen/automaton.hpp"

namespace parsley {

Automaton::Automaton(const Grammar &grammar) : grammar(grammar) {
  this->generateStates();
}

void Automaton::generateStates() {
  LRState start_state =
      closure(this->grammar, {Item{this->grammar.getAugmentedProduction(), 0}});
  this->states = {start_state};
  this->trans_table.emplace_back();
  this->state_ids[start_state] = 0;

  std::deque<uint32_t> worklist = {0};
  while (!worklist.empty()) {
    uint32_t curr_state = worklist.front();
    worklist.pop_front();

    // Copied since adding states may reallocate `states`
    const LRState items = this->states[curr_state];
    for (Symbol symbol : expectedSymbols(this->grammar, items)) {
      LRState next_state =
          closure(this->grammar, gotoSet(this->grammar, items, symbol));
      if (next_state.empty())
        continue;

      uint32_t target;
      if (auto same = this->state_ids.find(next_state);
          same != this->state_ids.end()) {
        target = same->second;
      } else {
        target = this->states.size();
        this->state_ids[next_state] = target;
        this->states.push_back(std::move(next_state));
        this->trans_table.emplace_back();
        worklist.push_back(target);
      }

      this->trans_table[curr_state][symbol] = target;
    }
  }
}

uint32_t Automaton::getStateCount() const { return this->states.size(); }

uint32_t Automaton::getInitialState() const { return 0; }

const LRState &Automaton::getState(uint32_t state) const {
  return this->states.at(state);
}

int Automaton::getTransition(uint32_t state, Symbol symbol) const {
  const auto &transitions = this->trans_table.at(state);
  if (auto next = transitions.find(symbol); next != transitions.end())
    return next->second;
  return -1;
}

std::vector<std::pair<Symbol, uint32_t>>
Automaton::getTransitions(uint32_t state) const {
  const auto &transitions = this->trans_table.at(state);
  std::vector<std::pair<Symbol, uint32_t>> ordered(transitions.begin(),
                                                   transitions.end());
  std::sort(ordered.begin(), ordered.end());
  return ordered;
}

int Automaton::findState(const LRState &state) const {
  if (auto same = this->state_ids.find(state); same != this->state_ids.end())
    return same->second;
  return -1;
}

void Automaton::printState(uint32_t state, std::ostream &out) const {
  out << "I" << state << ":\n";
  printItemSet(this->grammar, this->getState(state), out);
  for (const auto &[symbol, target] : this->getTransitions(state))
    out << "    " << this->grammar.symbolToString(symbol) << " -> I" << target
        << "\n";
}

void Automaton::printStates(std::ostream &out) const {
  for (uint32_t state = 0; state < this->states.size(); state++) {
    this->printState(state, out);
    out << "\n ---------- \n" << std::endl;
  }
}

} // namespace parsley
