#include <catch2/catch.hpp>
#include <set>
#include <sstream>

#include <ParsleyGen/symbol_sets.hpp>

#include "grammars.hpp"

using namespace parsley;

static std::set<uint32_t> terminals(const Grammar &grammar,
                                    std::vector<std::string> names) {
  std::set<uint32_t> ids;
  for (const std::string &name : names)
    ids.insert(name == "$" ? END_OF_INPUT : terminal(grammar, name).id);
  return ids;
}

SCENARIO("FIRST and FOLLOW of a factored expression grammar",
         "[symbol_sets]") {
  GIVEN("E := T E', E' := + T E' | ε, T := F T', T' := * F T' | ε, "
        "F := ( E ) | id") {
    Grammar grammar = factoredExpressionGrammar();
    SymbolSets sets(grammar);

    Symbol e = nonTerminal(grammar, "E");
    Symbol e_rest = nonTerminal(grammar, "E'");
    Symbol t = nonTerminal(grammar, "T");
    Symbol t_rest = nonTerminal(grammar, "T'");
    Symbol f = nonTerminal(grammar, "F");

    THEN("only the epsilon rules' heads are nullable") {
      REQUIRE(sets.isNullable(e_rest));
      REQUIRE(sets.isNullable(t_rest));
      REQUIRE_FALSE(sets.isNullable(e));
      REQUIRE_FALSE(sets.isNullable(t));
      REQUIRE_FALSE(sets.isNullable(f));
      REQUIRE_FALSE(sets.isNullable(terminal(grammar, "+")));
    }

    THEN("FIRST sets look through nullable prefixes") {
      REQUIRE(sets.getFirstSet(e) == terminals(grammar, {"(", "id"}));
      REQUIRE(sets.getFirstSet(t) == terminals(grammar, {"(", "id"}));
      REQUIRE(sets.getFirstSet(f) == terminals(grammar, {"(", "id"}));
      REQUIRE(sets.getFirstSet(e_rest) == terminals(grammar, {"+"}));
      REQUIRE(sets.getFirstSet(t_rest) == terminals(grammar, {"*"}));
      REQUIRE(sets.getFirstSet(terminal(grammar, ")")) ==
              terminals(grammar, {")"}));
    }

    THEN("FOLLOW sets include end of input where the start symbol ends") {
      REQUIRE(sets.getFollowSet(e.id) == terminals(grammar, {"$", ")"}));
      REQUIRE(sets.getFollowSet(e_rest.id) == terminals(grammar, {"$", ")"}));
      REQUIRE(sets.getFollowSet(t.id) ==
              terminals(grammar, {"$", "+", ")"}));
      REQUIRE(sets.getFollowSet(t_rest.id) ==
              terminals(grammar, {"$", "+", ")"}));
      REQUIRE(sets.getFollowSet(f.id) ==
              terminals(grammar, {"$", "+", "*", ")"}));
    }

    THEN("FIRST of a sequence stops at the first non-nullable symbol") {
      auto [first, nullable] = sets.getFirstSet({t_rest, e_rest});
      REQUIRE(first == terminals(grammar, {"*", "+"}));
      REQUIRE(nullable);

      auto [first_f, nullable_f] = sets.getFirstSet({t_rest, f, e_rest});
      REQUIRE(first_f == terminals(grammar, {"*", "(", "id"}));
      REQUIRE_FALSE(nullable_f);

      auto [empty, empty_nullable] = sets.getFirstSet({e, f}, 2);
      REQUIRE(empty.empty());
      REQUIRE(empty_nullable);
    }
  }
}

TEST_CASE("FIRST of a left recursive grammar", "[symbol_sets]") {
  Grammar grammar = expressionGrammar();
  SymbolSets sets(grammar);

  REQUIRE(sets.getFirstSet(nonTerminal(grammar, "E")) ==
          terminals(grammar, {"id"}));
  REQUIRE(sets.getFirstSet(nonTerminal(grammar, "T")) ==
          terminals(grammar, {"id"}));
  REQUIRE(sets.getFollowSet(nonTerminal(grammar, "S").id) ==
          terminals(grammar, {"$"}));
  REQUIRE(sets.getFollowSet(nonTerminal(grammar, "E").id) ==
          terminals(grammar, {"$", "+"}));
}

TEST_CASE("a left recursive nullable non-terminal", "[symbol_sets]") {
  Grammar grammar = leftRecursiveEpsilonGrammar();
  SymbolSets sets(grammar);
  Symbol a = nonTerminal(grammar, "A");

  REQUIRE(sets.isNullable(a));
  REQUIRE(sets.isNullable(nonTerminal(grammar, "S")));
  REQUIRE(sets.getFirstSet(a) == terminals(grammar, {"a"}));
  REQUIRE(sets.getFollowSet(a.id) == terminals(grammar, {"$", "a"}));
}

TEST_CASE("symbol set fixpoints stabilize", "[symbol_sets]") {
  for (Grammar grammar :
       {wikipediaGrammar(), expressionGrammar(), leftRecursiveEpsilonGrammar(),
        ambiguousSumGrammar(), factoredExpressionGrammar()}) {
    SymbolSets sets(grammar);
    std::size_t bound =
        grammar.getNonTerminalCount() + grammar.getProductionCount() + 1;

    REQUIRE(sets.getNullablePasses() <= bound);
    REQUIRE(sets.getFirstPasses() <= bound);
    REQUIRE(sets.getFollowPasses() <= bound);
    REQUIRE(sets.isFixpoint());
  }
}

TEST_CASE("symbol sets print every non-terminal", "[symbol_sets]") {
  Grammar grammar = leftRecursiveEpsilonGrammar();
  SymbolSets sets(grammar);

  std::ostringstream out;
  sets.printSymbolSets(out);
  REQUIRE(out.str().find("<A> (nullable)") != std::string::npos);
  REQUIRE(out.str().find("FOLLOW = { $, \"a\" }") != std::string::npos);
}
