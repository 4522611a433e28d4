#ifndef __PARSLEY_GEN_GRAMMAR__
#define __PARSLEY_GEN_GRAMMAR__

#include <boost/container_hash/extensions.hpp>
#include <boost/container_hash/hash.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <ParsleyUtil/ParsleyUtil.hpp>

namespace parsley {

enum SymbolKind { TERM, NON_TERM };

struct Symbol {
  SymbolKind kind;
  uint32_t id;

  bool operator==(Symbol const &other) const {
    return this->id == other.id && this->kind == other.kind;
  }
  bool operator!=(Symbol const &other) const { return !(*this == other); }
  // Terminals order before non-terminals
  bool operator<(Symbol const &other) const {
    return this->kind < other.kind ||
           (this->kind == other.kind && this->id < other.id);
  }
};

// Terminal id of the implicit end-of-input marker `$`
const uint32_t END_OF_INPUT = 0;

// line l: a -> A b c
// => {a, [A, b, c], l}
struct Production {
  Symbol lhs;
  std::vector<Symbol> rhs;
  // Line of the rule in its grammar definition, `0` when unknown
  std::size_t line;

  bool operator==(Production const &other) const {
    return this->lhs == other.lhs && this->rhs == other.rhs;
  }
  bool operator!=(Production const &other) const { return !(*this == other); }
};

class MalformedGrammarException : public ParsleyException {
public:
  MalformedGrammarException(std::string reason, std::string symbol,
                            std::optional<std::size_t> line = std::nullopt);

  const std::string &getSymbol() const;

private:
  std::string reason;
  std::string symbol;
  std::string message() const override;
};

class GrammarBuilder;

class Grammar {
public:
  uint32_t getTerminalCount() const;
  uint32_t getNonTerminalCount() const;
  const std::string &getTerminalString(uint32_t) const;
  const std::string &getNonTerminalString(uint32_t) const;
  bool isLiteral(uint32_t) const;

  std::optional<Symbol> findTerminal(const std::string &) const;
  std::optional<Symbol> findNonTerminal(const std::string &) const;

  Symbol getStartSymbol() const;
  Symbol getAugmentedStartSymbol() const;
  Symbol getEndOfInput() const;
  uint32_t getAugmentedProduction() const;

  std::size_t getProductionCount() const;
  const Production &getProduction(std::size_t) const;
  const std::vector<Production> &getProductions() const;
  // Indices of the productions of a non-terminal, in production order
  const std::vector<uint32_t> &getProductionsOf(Symbol) const;

  std::string symbolToString(Symbol) const;
  std::string productionToString(std::size_t) const;

  void printGrammar(std::ostream &out = std::cout) const;

private:
  Grammar() = default;

  std::vector<std::string> terminals;
  std::vector<bool> literals;
  std::vector<std::string> nonterminals;

  std::unordered_map<std::string, uint32_t> term_id_map;
  std::unordered_map<std::string, uint32_t> nonterm_id_map;

  std::vector<Production> rules;
  std::vector<std::vector<uint32_t>> rules_by_lhs;

  Symbol start_symbol;
  Symbol augmented_start;
  uint32_t augmented_rule;

  friend class GrammarBuilder;
};

class GrammarBuilder {
public:
  GrammarBuilder();

  Symbol newTerminal(std::string, bool is_literal = true);
  Symbol newNonTerminal(std::string);

  void addRule(std::string, std::vector<Symbol>, std::size_t line = 0);
  void addRule(Symbol, std::vector<Symbol>, std::size_t line = 0);
  void setStart(std::string);

  // Validates the rules and appends the augmented start rule S' -> S
  Grammar build() const;

private:
  std::vector<std::string> terminals;
  std::vector<bool> literals;
  std::vector<std::string> nonterminals;

  std::unordered_map<std::string, uint32_t> term_id_map;
  std::unordered_map<std::string, uint32_t> nonterm_id_map;

  std::vector<Production> rules;
  std::optional<std::string> start_name;

  void checkSymbol(Symbol, std::size_t) const;
};

} // namespace parsley

namespace boost {
template <> struct hash<parsley::Symbol> {
  size_t operator()(const parsley::Symbol &s) const {
    size_t hash = 0;
    boost::hash_combine(hash, s.kind);
    boost::hash_combine(hash, s.id);
    return hash;
  }
};

template <> struct hash<parsley::Production> {
  size_t operator()(const parsley::Production &p) const {
    size_t hash = 0;
    boost::hash_combine(hash, p.lhs);
    boost::hash_combine(hash, p.rhs);
    return hash;
  }
};
} // namespace boost

#endif
