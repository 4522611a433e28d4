#ifndef __PARSLEY_GEN_SYMBOL_SETS__
#define __PARSLEY_GEN_SYMBOL_SETS__

#include <cstddef>
#include <iostream>
#include <set>
#include <utility>
#include <vector>

#include "grammar.hpp"

namespace parsley {

// Nullable, FIRST and FOLLOW sets of a grammar, each computed by repeated
// passes over the productions until a pass changes nothing.
class SymbolSets {
public:
  explicit SymbolSets(const Grammar &);
  explicit SymbolSets(const Grammar &&) = delete;

  bool isNullable(Symbol) const;
  std::set<uint32_t> getFirstSet(Symbol) const;
  // FIRST of rhs[from..] and whether all of rhs[from..] is nullable
  std::pair<std::set<uint32_t>, bool>
  getFirstSet(const std::vector<Symbol> &, std::size_t from = 0) const;
  const std::set<uint32_t> &getFollowSet(uint32_t) const;

  // Passes taken by each fixpoint, including the last one that changed nothing
  std::size_t getNullablePasses() const;
  std::size_t getFirstPasses() const;
  std::size_t getFollowPasses() const;

  // True if another pass of every fixpoint would leave the sets unchanged
  bool isFixpoint() const;

  void printSymbolSets(std::ostream &out = std::cout) const;

private:
  const Grammar &grammar;

  std::vector<bool> nullable;
  std::vector<std::set<uint32_t>> first_sets;
  std::vector<std::set<uint32_t>> follow_sets;

  std::size_t nullable_passes = 0;
  std::size_t first_passes = 0;
  std::size_t follow_passes = 0;

  bool nullablePass();
  bool firstPass();
  bool followPass();
  void printSet(const std::set<uint32_t> &, std::ostream &) const;
};

} // namespace parsley

#endif
