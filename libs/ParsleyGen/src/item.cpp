#include <algorithm>
#include <unordered_set>

#include "ParsleyGen/item.hpp"

namespace parsley {

InvalidItemException::InvalidItemException(std::string reason)
    : ParsleyException(std::nullopt), reason(reason) {}

std::string InvalidItemException::message() const {
  return "Can't advance item: " + this->reason + ".";
}

bool isComplete(const Grammar &grammar, Item item) {
  return item.dot >= grammar.getProduction(item.production).rhs.size();
}

std::optional<Symbol> expectingSymbol(const Grammar &grammar, Item item) {
  const std::vector<Symbol> &rhs = grammar.getProduction(item.production).rhs;
  if (item.dot >= rhs.size())
    return std::nullopt;
  return rhs[item.dot];
}

Item advance(const Grammar &grammar, Item item) {
  if (isComplete(grammar, item))
    throw InvalidItemException(
        "parser position already at end of production");
  return Item{item.production, item.dot + 1};
}

void canonicalize(ItemSet &items) {
  std::sort(items.begin(), items.end());
  items.erase(std::unique(items.begin(), items.end()), items.end());
}

ItemSet closure(const Grammar &grammar, ItemSet unfinished) {
  std::unordered_set<Item, boost::hash<Item>> present(unfinished.begin(),
                                                      unfinished.end());

  std::size_t curr_item = 0;
  while (curr_item < unfinished.size()) {
    Item item = unfinished[curr_item];
    curr_item++;

    std::optional<Symbol> next = expectingSymbol(grammar, item);
    if (!next.has_value() || next->kind == TERM)
      continue;

    for (uint32_t rule : grammar.getProductionsOf(next.value())) {
      Item expanded{rule, 0};
      if (present.insert(expanded).second)
        unfinished.push_back(expanded);
    }
  }

  canonicalize(unfinished);
  return unfinished;
}

ItemSet gotoSet(const Grammar &grammar, const ItemSet &state, Symbol symbol) {
  ItemSet next_items;
  for (const Item &item : state) {
    if (expectingSymbol(grammar, item) == symbol)
      next_items.push_back(Item{item.production, item.dot + 1});
  }

  canonicalize(next_items);
  return next_items;
}

std::set<Symbol> expectedSymbols(const Grammar &grammar,
                                 const ItemSet &items) {
  std::set<Symbol> symbols;
  for (const Item &item : items) {
    if (std::optional<Symbol> next = expectingSymbol(grammar, item))
      symbols.insert(next.value());
  }
  return symbols;
}

std::map<Symbol, ItemSet> constructTransitions(const Grammar &grammar,
                                               const ItemSet &items) {
  std::map<Symbol, ItemSet> transitions;
  for (Symbol symbol : expectedSymbols(grammar, items))
    transitions[symbol] = closure(grammar, gotoSet(grammar, items, symbol));
  return transitions;
}

std::string itemToString(const Grammar &grammar, Item item) {
  const auto &[lhs, rhs, _] = grammar.getProduction(item.production);

  std::string item_str = grammar.symbolToString(lhs) + " ::=";
  for (std::size_t i = 0; i < rhs.size(); i++) {
    if (i == item.dot)
      item_str += " @";
    item_str += " " + grammar.symbolToString(rhs[i]);
  }
  if (item.dot >= rhs.size())
    item_str += " @";

  return item_str;
}

void printItemSet(const Grammar &grammar, const ItemSet &items,
                  std::ostream &out) {
  for (const Item &item : items)
    out << "  " << itemToString(grammar, item) << "\n";
}

} // namespace parsley
