#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "ParsleyGen/grammar.hpp"

namespace parsley {

MalformedGrammarException::MalformedGrammarException(
    std::string reason, std::string symbol, std::optional<std::size_t> line)
    : ParsleyException(line), reason(reason), symbol(symbol) {}

const std::string &MalformedGrammarException::getSymbol() const {
  return this->symbol;
}

std::string MalformedGrammarException::message() const {
  if (this->symbol.empty())
    return "Malformed grammar: " + this->reason + ".";
  return "Malformed grammar: " + this->reason + ": " + this->symbol;
}

uint32_t Grammar::getTerminalCount() const { return this->terminals.size(); }

uint32_t Grammar::getNonTerminalCount() const {
  return this->nonterminals.size();
}

const std::string &Grammar::getTerminalString(uint32_t id) const {
  return this->terminals.at(id);
}

const std::string &Grammar::getNonTerminalString(uint32_t id) const {
  return this->nonterminals.at(id);
}

bool Grammar::isLiteral(uint32_t id) const { return this->literals.at(id); }

std::optional<Symbol> Grammar::findTerminal(const std::string &name) const {
  if (auto id_index = this->term_id_map.find(name);
      id_index != this->term_id_map.end())
    return Symbol{TERM, id_index->second};
  return std::nullopt;
}

std::optional<Symbol> Grammar::findNonTerminal(const std::string &name) const {
  if (auto id_index = this->nonterm_id_map.find(name);
      id_index != this->nonterm_id_map.end())
    return Symbol{NON_TERM, id_index->second};
  return std::nullopt;
}

Symbol Grammar::getStartSymbol() const { return this->start_symbol; }

Symbol Grammar::getAugmentedStartSymbol() const {
  return this->augmented_start;
}

Symbol Grammar::getEndOfInput() const { return Symbol{TERM, END_OF_INPUT}; }

uint32_t Grammar::getAugmentedProduction() const {
  return this->augmented_rule;
}

std::size_t Grammar::getProductionCount() const { return this->rules.size(); }

const Production &Grammar::getProduction(std::size_t rule) const {
  return this->rules.at(rule);
}

const std::vector<Production> &Grammar::getProductions() const {
  return this->rules;
}

const std::vector<uint32_t> &Grammar::getProductionsOf(Symbol non_term) const {
  if (non_term.kind != NON_TERM)
    throw std::out_of_range("terminals have no productions");
  return this->rules_by_lhs.at(non_term.id);
}

// Replaces every `c` in `name` with `c` repeated twice
static std::string doubled(const std::string &name, char c) {
  std::string result;
  for (char ch : name) {
    result.push_back(ch);
    if (ch == c)
      result.push_back(ch);
  }
  return result;
}

std::string Grammar::symbolToString(Symbol symbol) const {
  if (symbol.kind == TERM) {
    if (symbol.id == END_OF_INPUT)
      return "$";
    if (this->isLiteral(symbol.id))
      return "\"" + doubled(this->getTerminalString(symbol.id), '"') + "\"";
    return "?" + doubled(this->getTerminalString(symbol.id), '?') + "?";
  }

  std::string visual_name;
  for (char ch : this->getNonTerminalString(symbol.id)) {
    if (ch == '<' || ch == '>')
      visual_name.push_back('\\');
    visual_name.push_back(ch);
  }
  return "<" + visual_name + ">";
}

std::string Grammar::productionToString(std::size_t rule) const {
  const auto &[lhs, rhs, _] = this->getProduction(rule);

  std::string production = this->symbolToString(lhs) + " ::=";
  for (Symbol symbol : rhs)
    production += " " + this->symbolToString(symbol);
  return production;
}

void Grammar::printGrammar(std::ostream &out) const {
  char index[16];
  for (std::size_t i = 0; i < this->rules.size(); i++) {
    std::snprintf(index, sizeof(index), "%4zu  ", i);
    out << (i == this->augmented_rule ? "$ " : "  ") << index
        << this->productionToString(i) << "\n";
  }
  out << std::endl;
}

// End of input takes id 0 but no name, so a user terminal "$" stays distinct
GrammarBuilder::GrammarBuilder() {
  this->terminals.push_back("$");
  this->literals.push_back(false);
}

Symbol GrammarBuilder::newTerminal(std::string name, bool is_literal) {
  if (auto id_index = this->term_id_map.find(name);
      id_index == this->term_id_map.end()) {
    this->term_id_map[name] = this->terminals.size();
    this->terminals.push_back(name);
    this->literals.push_back(is_literal);
  }
  return {TERM, this->term_id_map[name]};
}

Symbol GrammarBuilder::newNonTerminal(std::string name) {
  if (auto id_index = this->nonterm_id_map.find(name);
      id_index == this->nonterm_id_map.end()) {
    this->nonterm_id_map[name] = this->nonterminals.size();
    this->nonterminals.push_back(name);
  }
  return {NON_TERM, this->nonterm_id_map[name]};
}

void GrammarBuilder::checkSymbol(Symbol symbol, std::size_t line) const {
  if (symbol.kind == TERM && symbol.id >= this->terminals.size())
    throw MalformedGrammarException("unknown terminal id",
                                    std::to_string(symbol.id), line);
  if (symbol.kind == NON_TERM && symbol.id >= this->nonterminals.size())
    throw MalformedGrammarException("unknown non-terminal id",
                                    std::to_string(symbol.id), line);
}

void GrammarBuilder::addRule(std::string name, std::vector<Symbol> rhs,
                             std::size_t line) {
  Symbol head = this->newNonTerminal(name);
  this->addRule(head, std::move(rhs), line);
}

void GrammarBuilder::addRule(Symbol head, std::vector<Symbol> rhs,
                             std::size_t line) {
  this->checkSymbol(head, line);
  if (head.kind != NON_TERM)
    throw MalformedGrammarException("left hand side of a rule must be a "
                                    "non-terminal",
                                    this->terminals[head.id], line);
  for (Symbol symbol : rhs)
    this->checkSymbol(symbol, line);

  this->rules.push_back({head, std::move(rhs), line});
}

void GrammarBuilder::setStart(std::string name) { this->start_name = name; }

Grammar GrammarBuilder::build() const {
  if (!this->start_name.has_value())
    throw MalformedGrammarException("no start symbol was set", "");

  std::vector<std::vector<uint32_t>> rules_by_lhs(this->nonterminals.size());
  for (uint32_t rule = 0; rule < this->rules.size(); rule++)
    rules_by_lhs[this->rules[rule].lhs.id].push_back(rule);

  auto start_index = this->nonterm_id_map.find(this->start_name.value());
  if (start_index == this->nonterm_id_map.end() ||
      rules_by_lhs[start_index->second].empty())
    throw MalformedGrammarException("start symbol has no productions",
                                    this->start_name.value());

  for (const auto &[head, rhs, line] : this->rules) {
    for (Symbol symbol : rhs) {
      if (symbol.kind == NON_TERM && rules_by_lhs[symbol.id].empty())
        throw MalformedGrammarException("undefined non-terminal",
                                        this->nonterminals[symbol.id], line);
    }
  }

  Grammar grammar;
  grammar.terminals = this->terminals;
  grammar.literals = this->literals;
  grammar.nonterminals = this->nonterminals;
  grammar.term_id_map = this->term_id_map;
  grammar.nonterm_id_map = this->nonterm_id_map;
  grammar.rules = this->rules;
  grammar.rules_by_lhs = rules_by_lhs;
  grammar.start_symbol = Symbol{NON_TERM, start_index->second};

  // Add S' -> S rule
  std::string augmented_name = this->start_name.value() + "\'";
  while (grammar.nonterm_id_map.count(augmented_name) != 0)
    augmented_name += "\'";

  grammar.augmented_start =
      Symbol{NON_TERM, static_cast<uint32_t>(grammar.nonterminals.size())};
  grammar.nonterm_id_map[augmented_name] = grammar.augmented_start.id;
  grammar.nonterminals.push_back(augmented_name);

  uint32_t first_start_rule = rules_by_lhs[start_index->second][0];
  std::size_t start_line = this->rules[first_start_rule].line;
  grammar.augmented_rule = grammar.rules.size();
  grammar.rules.push_back(
      {grammar.augmented_start, {grammar.start_symbol}, start_line});
  grammar.rules_by_lhs.push_back({grammar.augmented_rule});

  return grammar;
}

} // namespace parsley
