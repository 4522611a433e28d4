#include <catch2/catch.hpp>
#include <string>

#include <ParsleyGen/grammar.hpp>

#include "grammars.hpp"

using namespace parsley;

TEST_CASE("symbols render like the grammar notation", "[grammar]") {
  GrammarBuilder builder;
  Symbol klass = builder.newTerminal("class");
  Symbol quoted = builder.newTerminal("A \"test\" literal");
  Symbol weird = builder.newTerminal("weird?", false);
  Symbol expr = builder.newNonTerminal("expr");
  Symbol angled = builder.newNonTerminal("a<b>");
  builder.addRule(expr, {klass, quoted, weird});
  builder.addRule(angled, {expr});
  builder.setStart("a<b>");
  Grammar grammar = builder.build();

  REQUIRE(grammar.getTerminalString(klass.id) == "class");
  REQUIRE(grammar.symbolToString(klass) == "\"class\"");
  REQUIRE(grammar.symbolToString(quoted) == "\"A \"\"test\"\" literal\"");
  REQUIRE(grammar.symbolToString(weird) == "?weird???");
  REQUIRE(grammar.symbolToString(expr) == "<expr>");
  REQUIRE(grammar.symbolToString(angled) == "<a\\<b\\>>");
  REQUIRE(grammar.symbolToString(grammar.getEndOfInput()) == "$");
}

TEST_CASE("productions render, compare and hash by content", "[grammar]") {
  GrammarBuilder builder;
  Symbol expr = builder.newNonTerminal("expr");
  Symbol number = builder.newTerminal("number", false);
  Symbol plus = builder.newTerminal("+");
  builder.addRule(expr, {number, plus, expr}, 4);
  builder.addRule(expr, {number, plus, number}, 5);
  builder.setStart("expr");
  Grammar grammar = builder.build();

  REQUIRE(grammar.productionToString(0) == "<expr> ::= ?number? \"+\" <expr>");

  Production same{expr, {number, plus, expr}, 0};
  REQUIRE(grammar.getProduction(0) == same);
  REQUIRE(grammar.getProduction(0) != grammar.getProduction(1));
  REQUIRE(boost::hash<Production>()(grammar.getProduction(0)) ==
          boost::hash<Production>()(same));
  REQUIRE(grammar.getProduction(0).line == 4);
}

SCENARIO("a grammar is augmented with a single accepting rule", "[grammar]") {
  GIVEN("the grammar E := E * B | E + B | B, B := 0 | 1") {
    Grammar grammar = wikipediaGrammar();

    THEN("the augmented rule comes after every user rule") {
      REQUIRE(grammar.getProductionCount() == 6);
      REQUIRE(grammar.getAugmentedProduction() == 5);

      const Production &augmented = grammar.getProduction(5);
      REQUIRE(augmented.lhs == grammar.getAugmentedStartSymbol());
      REQUIRE(augmented.rhs == std::vector<Symbol>{grammar.getStartSymbol()});
      REQUIRE(grammar.productionToString(5) == "<E'> ::= <E>");
    }

    THEN("productions are grouped by their left hand side") {
      REQUIRE(grammar.getProductionsOf(nonTerminal(grammar, "E")) ==
              std::vector<uint32_t>{0, 1, 2});
      REQUIRE(grammar.getProductionsOf(nonTerminal(grammar, "B")) ==
              std::vector<uint32_t>{3, 4});
      REQUIRE(grammar.getProductionsOf(grammar.getAugmentedStartSymbol()) ==
              std::vector<uint32_t>{5});
    }

    THEN("end of input is terminal 0") {
      REQUIRE(grammar.getEndOfInput() == Symbol{TERM, END_OF_INPUT});
      REQUIRE(grammar.getTerminalCount() == 5);
      REQUIRE(grammar.getNonTerminalCount() == 3);
    }
  }

  GIVEN("a grammar already using the primed start name") {
    Grammar grammar = factoredExpressionGrammar();

    THEN("the augmented start symbol gets a fresh name") {
      Symbol augmented = grammar.getAugmentedStartSymbol();
      REQUIRE(grammar.getNonTerminalString(augmented.id) == "E''");
      REQUIRE(augmented != nonTerminal(grammar, "E'"));
    }
  }
}

SCENARIO("malformed grammars are rejected before any analysis",
         "[grammar]") {
  GIVEN("a rule using a non-terminal that has no productions") {
    GrammarBuilder builder;
    Symbol s = builder.newNonTerminal("S");
    Symbol a = builder.newNonTerminal("A");
    Symbol b = builder.newTerminal("b");
    builder.addRule(s, {b}, 1);
    builder.addRule(s, {a, b}, 3);
    builder.setStart("S");

    THEN("building names the undefined symbol and its rule") {
      REQUIRE_THROWS_AS(builder.build(), MalformedGrammarException);

      try {
        builder.build();
        FAIL("expected a malformed grammar");
      } catch (const MalformedGrammarException &e) {
        REQUIRE(e.getSymbol() == "A");
        REQUIRE(e.getLine() == std::optional<std::size_t>(3));
        std::string message = e.what();
        REQUIRE(message.find("undefined non-terminal: A") !=
                std::string::npos);
        REQUIRE(message.find("--> line 3") != std::string::npos);
      }
    }
  }

  GIVEN("no start symbol") {
    GrammarBuilder builder;
    builder.addRule("S", {builder.newTerminal("x")});

    THEN("building fails") {
      REQUIRE_THROWS_AS(builder.build(), MalformedGrammarException);
    }
  }

  GIVEN("a start symbol without productions") {
    GrammarBuilder builder;
    builder.addRule("S", {builder.newTerminal("x")});
    builder.setStart("Z");

    THEN("building names the start symbol") {
      try {
        builder.build();
        FAIL("expected a malformed grammar");
      } catch (const MalformedGrammarException &e) {
        REQUIRE(e.getSymbol() == "Z");
        REQUIRE_FALSE(e.getLine().has_value());
      }
    }
  }

  GIVEN("a terminal on the left hand side") {
    GrammarBuilder builder;
    Symbol x = builder.newTerminal("x");

    THEN("adding the rule fails") {
      REQUIRE_THROWS_AS(builder.addRule(x, {x}), MalformedGrammarException);
    }
  }

  GIVEN("a head symbol with an id the builder never handed out") {
    GrammarBuilder builder;
    Symbol x = builder.newTerminal("x");

    THEN("adding the rule fails as malformed") {
      REQUIRE_THROWS_AS(builder.addRule(Symbol{TERM, 7}, {x}),
                        MalformedGrammarException);
      REQUIRE_THROWS_AS(builder.addRule(Symbol{NON_TERM, 7}, {x}),
                        MalformedGrammarException);
    }
  }
}

TEST_CASE("a terminal named $ is not the end of input", "[grammar]") {
  GrammarBuilder builder;
  Symbol dollar = builder.newTerminal("$");
  Symbol x = builder.newTerminal("x");
  builder.addRule("S", {x, dollar});
  builder.setStart("S");
  Grammar grammar = builder.build();

  REQUIRE(dollar.id != END_OF_INPUT);
  REQUIRE(grammar.getTerminalCount() == 3);
  REQUIRE(grammar.findTerminal("$") == dollar);
  REQUIRE(grammar.symbolToString(dollar) == "\"$\"");
  REQUIRE(grammar.symbolToString(grammar.getEndOfInput()) == "$");
}

TEST_CASE("names are interned per namespace", "[grammar]") {
  GrammarBuilder builder;
  Symbol term = builder.newTerminal("x");
  Symbol nonterm = builder.newNonTerminal("x");

  REQUIRE(builder.newTerminal("x") == term);
  REQUIRE(builder.newNonTerminal("x") == nonterm);
  REQUIRE(term != nonterm);

  builder.addRule(nonterm, {term});
  builder.setStart("x");
  Grammar grammar = builder.build();
  REQUIRE(grammar.findTerminal("x") == term);
  REQUIRE(grammar.findNonTerminal("x") == nonterm);
  REQUIRE_FALSE(grammar.findTerminal("y").has_value());
}
