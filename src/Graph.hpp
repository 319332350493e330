#pragma once

#include <fmt/format.h>

#include <vector>
#include <map>
#include <queue>
#include <functional>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

// Directed graph with a value stored on each vertex and a weight on each edge.
template <typename V = int, typename W = int>
class DirectedGraph {
  public:
    std::vector<std::map<uint32_t, W>> edges;
    std::vector<V> vals;

    uint32_t num_vertices;

    DirectedGraph() : num_vertices(0) {}

    DirectedGraph(uint32_t num_vertices) : num_vertices(0) {
      for (uint32_t i = 0; i < num_vertices; i++) {
        add_vertex();
      }
    }

    void add_vertex() {
      add_vertex(V());
    }

    void add_vertex(V val) {
      num_vertices++;
      edges.push_back(std::map<uint32_t, W>());
      vals.push_back(std::move(val));
    }

    void set_val(uint32_t i, V val) {
      check_vertex(i);
      vals[i] = std::move(val);
    }

    const V& get_val(uint32_t i) const {
      check_vertex(i);
      return vals[i];
    }

    void add_edge(uint32_t v1, uint32_t v2, W w = W()) {
      check_vertex(v1);
      check_vertex(v2);
      edges[v1][v2] = w;
    }

    void remove_edge(uint32_t v1, uint32_t v2) {
      edges[v1].erase(v2);
    }

    bool contains_edge(uint32_t v1, uint32_t v2) const {
      return edges[v1].contains(v2);
    }

    std::vector<uint32_t> edges_of(uint32_t v) const {
      std::vector<uint32_t> out;
      for (auto const &[j, _] : edges[v]) {
        out.push_back(j);
      }
      return out;
    }

    uint32_t degree(uint32_t v) const {
      return edges[v].size();
    }

    uint32_t in_degree(uint32_t v) const {
      uint32_t n = 0;
      for (uint32_t i = 0; i < num_vertices; i++) {
        if (edges[i].contains(v)) {
          n++;
        }
      }
      return n;
    }

    // Kahn's algorithm. Ties are broken by the smallest vertex index so that the
    // ordering of an instruction DAG reproduces the original instruction order.
    std::vector<uint32_t> topological_order() const {
      std::vector<uint32_t> in_degrees(num_vertices, 0);
      for (uint32_t i = 0; i < num_vertices; i++) {
        for (auto const &[j, _] : edges[i]) {
          in_degrees[j]++;
        }
      }

      std::priority_queue<uint32_t, std::vector<uint32_t>, std::greater<uint32_t>> ready;
      for (uint32_t i = 0; i < num_vertices; i++) {
        if (in_degrees[i] == 0) {
          ready.push(i);
        }
      }

      std::vector<uint32_t> order;
      order.reserve(num_vertices);
      while (!ready.empty()) {
        uint32_t v = ready.top();
        ready.pop();
        order.push_back(v);

        for (auto const &[j, _] : edges[v]) {
          if (--in_degrees[j] == 0) {
            ready.push(j);
          }
        }
      }

      if (order.size() != num_vertices) {
        throw std::runtime_error(fmt::format("Graph with {} vertices contains a cycle; no topological order exists.", num_vertices));
      }

      return order;
    }

    std::string to_string() const {
      std::string s = "";
      for (uint32_t i = 0; i < num_vertices; i++) {
        s += fmt::format("{} -> ", i);
        for (auto const &[j, w] : edges[i]) {
          s += fmt::format("({}: {}) ", j, w);
        }
        if (i != num_vertices - 1) {
          s += "\n";
        }
      }
      return s;
    }

  private:
    void check_vertex(uint32_t v) const {
      if (v >= num_vertices) {
        throw std::out_of_range(fmt::format("Vertex {} out of range for graph with {} vertices.", v, num_vertices));
      }
    }
};
