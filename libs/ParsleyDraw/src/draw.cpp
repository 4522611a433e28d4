#include "ParsleyDraw/draw.hpp"

#include <drag/drag.hpp>
#include <drag/drawing/draw.hpp>
#include <drag/types.hpp>
#include <vector>

namespace parsley {

void drawAutomaton(const Grammar &grammar, const Automaton &automaton,
                   const std::string &file_name) {
  drag::graph g;
  std::vector<drag::vertex_t> state_nodes;

  drag::drawing_options opts;

  // Add nodes
  for (uint32_t state = 0; state < automaton.getStateCount(); state++) {
    drag::vertex_t graph_node = g.add_node();
    state_nodes.push_back(graph_node);
    opts.labels[graph_node] = "I" + std::to_string(state);

    for (const Item &item : automaton.getState(state)) {
      if (item.production == grammar.getAugmentedProduction() &&
          isComplete(grammar, item))
        opts.labels[graph_node] += " acc";
    }
  }

  // Add edges
  for (uint32_t state = 0; state < automaton.getStateCount(); state++) {
    for (const auto &[symbol, target] : automaton.getTransitions(state)) {
      drag::vertex_t from = state_nodes[state], to = state_nodes[target];
      g.add_edge(from, to);
      opts.edge_colors[{from, to}] = symbol.kind == TERM ? "blue" : "red";
    }
  }

  drag::sugiyama_layout layout(g);

  auto image = drag::draw_svg_image(layout, opts);
  image.save(file_name);
}

} // namespace parsley
