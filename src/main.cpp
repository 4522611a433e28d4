#include <ParsleyGen/generator.hpp>
#include <iostream>

#include "demo.hpp"

int main() {
  try {
    parsley::Grammar g = demoGrammar();
    std::cout << "Making SLR(1) parse table" << std::endl;
    parsley::LRGenerator generator(g);
    generator.printReport();

    if (!generator.isParseable()) {
      std::cerr << "ERROR: The grammar is not SLR(1)." << std::endl;
      return -1;
    }
  } catch (const ParsleyException &e) {
    std::cerr << e.what() << std::endl;
    return -1;
  }

  return 0;
}
