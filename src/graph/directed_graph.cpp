#include <robodiff/graph/directed_graph.h>

#include <boost/graph/breadth_first_search.hpp>
#include <boost/graph/graph_traits.hpp>

namespace robodiff {
namespace graph {

namespace {

struct reach_visitor : boost::default_bfs_visitor
{
  explicit reach_visitor(std::vector<int>& order) : order(order)
  {
  }

  void discover_vertex(DirectedGraph::V v, DirectedGraph::G const&)
  {
    order.push_back(static_cast<int>(v));
  }

private:
  std::vector<int>& order;
};

}  // namespace

DirectedGraph::DirectedGraph(std::size_t num_vertices, const std::vector<Edge>& edges)
  : g(edges.begin(), edges.end(), num_vertices)
{
}

std::size_t DirectedGraph::numVertices() const
{
  return num_vertices(g);
}

std::size_t DirectedGraph::inDegree(int v) const
{
  return in_degree(vertex(v, g), g);
}

std::vector<int> DirectedGraph::roots() const
{
  std::vector<int> out;
  for (std::size_t v = 0; v < num_vertices(g); ++v)
  {
    if (in_degree(v, g) == 0)
      out.push_back(static_cast<int>(v));
  }
  return out;
}

std::vector<int> DirectedGraph::reachableFrom(int start) const
{
  std::vector<int> order;
  std::vector<boost::default_color_type> colors(num_vertices(g), boost::white_color);
  boost::breadth_first_search(
      g, vertex(start, g),
      boost::visitor(reach_visitor(order))
          .color_map(boost::make_iterator_property_map(colors.begin(), boost::get(boost::vertex_index, g))));
  return order;
}

}  // namespace graph
}  // namespace robodiff
