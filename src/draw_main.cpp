#include <ParsleyDraw/draw.hpp>
#include <ParsleyGen/automaton.hpp>
#include <iostream>

#include "demo.hpp"

int main(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <file.svg>" << std::endl;
    return -1;
  }

  try {
    parsley::Grammar g = demoGrammar();
    parsley::Automaton automaton(g);
    parsley::drawAutomaton(g, automaton, argv[1]);
    std::cout << "Saved " << automaton.getStateCount() << " states to "
              << argv[1] << std::endl;
  } catch (const ParsleyException &e) {
    std::cerr << e.what() << std::endl;
    return -1;
  }

  return 0;
}
