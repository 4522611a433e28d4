#include "demo.hpp"

parsley::Grammar demoGrammar() {
  parsley::GrammarBuilder builder;

  parsley::Symbol e = builder.newNonTerminal("E");
  parsley::Symbol b = builder.newNonTerminal("B");
  parsley::Symbol star = builder.newTerminal("*");
  parsley::Symbol plus = builder.newTerminal("+");
  parsley::Symbol zero = builder.newTerminal("0");
  parsley::Symbol one = builder.newTerminal("1");

  builder.addRule(e, {e, star, b}, 1);
  builder.addRule(e, {e, plus, b}, 1);
  builder.addRule(e, {b}, 1);
  builder.addRule(b, {zero}, 2);
  builder.addRule(b, {one}, 2);
  builder.setStart("E");

  return builder.build();
}
