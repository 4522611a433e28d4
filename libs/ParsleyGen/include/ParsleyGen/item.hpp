#ifndef __PARSLEY_GEN_ITEM__
#define __PARSLEY_GEN_ITEM__

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "grammar.hpp"

namespace parsley {

// A production with a dot: `dot` right hand side symbols have been seen
struct Item {
  uint32_t production;
  uint32_t dot;

  bool operator==(Item const &other) const {
    return this->production == other.production && this->dot == other.dot;
  }
  bool operator!=(Item const &other) const { return !(*this == other); }
  bool operator<(Item const &other) const {
    return this->production < other.production ||
           (this->production == other.production && this->dot < other.dot);
  }
};

// Sorted and free of duplicates once canonicalized, so equal sets of items
// are equal vectors
typedef std::vector<Item> ItemSet;

class InvalidItemException : public ParsleyException {
public:
  InvalidItemException(std::string reason);

private:
  std::string reason;
  std::string message() const override;
};

bool isComplete(const Grammar &, Item);
std::optional<Symbol> expectingSymbol(const Grammar &, Item);
Item advance(const Grammar &, Item);

void canonicalize(ItemSet &);
ItemSet closure(const Grammar &, ItemSet);
ItemSet gotoSet(const Grammar &, const ItemSet &, Symbol);
std::set<Symbol> expectedSymbols(const Grammar &, const ItemSet &);
// Closed goto set for every symbol expected by the item set
std::map<Symbol, ItemSet> constructTransitions(const Grammar &,
                                               const ItemSet &);

std::string itemToString(const Grammar &, Item);
void printItemSet(const Grammar &, const ItemSet &,
                  std::ostream &out = std::cout);

} // namespace parsley

namespace boost {
template <> struct hash<parsley::Item> {
  size_t operator()(const parsley::Item &i) const {
    size_t hash = 0;
    boost::hash_combine(hash, i.production);
    boost::hash_combine(hash, i.dot);
    return hash;
  }
};
} // namespace boost

#endif
