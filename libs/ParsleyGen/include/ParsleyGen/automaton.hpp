#ifndef __PARSLEY_GEN_AUTOMATON__
#define __PARSLEY_GEN_AUTOMATON__

#include <cstdint>
#include <iostream>
#include <unordered_map>
#include <utility>
#include <vector>

#include "grammar.hpp"
#include "item.hpp"

namespace parsley {

typedef ItemSet LRState;

// Canonical collection of LR(0) states. States are addressed by index and
// state 0 is the closure of the augmented start item.
class Automaton {
public:
  explicit Automaton(const Grammar &);
  explicit Automaton(const Grammar &&) = delete;

  uint32_t getStateCount() const;
  uint32_t getInitialState() const;
  const LRState &getState(uint32_t) const;

  int getTransition(uint32_t, Symbol) const;
  // Outgoing transitions of a state, ordered by symbol
  std::vector<std::pair<Symbol, uint32_t>> getTransitions(uint32_t) const;

  // Index of the state with exactly these (canonical) items, or -1
  int findState(const LRState &) const;

  void printState(uint32_t, std::ostream &out = std::cout) const;
  void printStates(std::ostream &out = std::cout) const;

private:
  const Grammar &grammar;
  std::vector<LRState> states;

  std::vector<std::unordered_map<Symbol, uint32_t, boost::hash<Symbol>>>
      trans_table;
  std::unordered_map<LRState, uint32_t, boost::hash<LRState>> state_ids;

  void generateStates();
};

} // namespace parsley

#endif
