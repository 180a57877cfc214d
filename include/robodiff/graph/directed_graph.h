#ifndef ROBODIFF_GRAPH_DIRECTED_GRAPH_H_
#define ROBODIFF_GRAPH_DIRECTED_GRAPH_H_

#include <vector>

#include <boost/graph/adjacency_list.hpp>

namespace robodiff {
namespace graph {

/**
 * @brief Directed graph over integer vertices, used to check kinematic tree structure.
 */
class DirectedGraph
{
public:
  typedef std::pair<int, int> Edge;
  using G = boost::adjacency_list<boost::vecS, boost::vecS, boost::bidirectionalS>;
  using V = G::vertex_descriptor;

  DirectedGraph(std::size_t num_vertices, const std::vector<Edge>& edges);

  std::size_t numVertices() const;
  std::size_t inDegree(int v) const;

  // Vertices without incoming edges.
  std::vector<int> roots() const;

  // Vertices reachable from start, start included, in breadth-first order.
  std::vector<int> reachableFrom(int start) const;

private:
  G g;
};

}  // namespace graph
}  // namespace robodiff

#endif  // ROBODIFF_GRAPH_DIRECTED_GRAPH_H_
