#ifndef ROBODIFF_USD_STAGE_H_
#define ROBODIFF_USD_STAGE_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <robodiff/usd/usda_reader.h>

namespace robodiff {
namespace usd {

// Composed view of one prim: strongest opinion per property, children from every contributing spec.
struct Prim
{
  std::string path;
  std::string name;
  std::string type_name;
  Specifier specifier = Specifier::Over;
  std::vector<std::string> api_schemas;
  std::map<std::string, Attribute> attributes;
  std::map<std::string, std::vector<std::string>> relationships;  // targets mapped to stage paths
  std::vector<std::string> referenced_assets;                      // external arcs, resolved paths
  std::vector<Prim> children;

  std::string layer;  // strongest contributing layer
  int line = 0;

  bool hasApi(const std::string& schema) const;
  const Attribute* attribute(const std::string& attr_name) const;
  const std::vector<std::string>* relationship(const std::string& rel_name) const;
  const Prim* child(const std::string& child_name) const;

  // "layer:line:/path" for messages.
  std::string where() const;
};

/**
 * @brief Minimal composition of a USD layer stack.
 *
 * Supports subLayers, references, payloads, inherits and over specs. Variants, specializes, time
 * samples and value clips are not composed. Composition cycles and runaway nesting raise ParseError.
 */
class Stage
{
public:
  Stage();
  ~Stage();

  void openFile(const std::string& filename);
  void openText(const std::string& text, const std::string& directory, const std::string& identifier);

  // defaultPrim of the root layer, else the first root def prim. Throws ParseError when there is none.
  std::string robotPrimPath() const;

  // metersPerUnit of the root layer; 1 when not authored.
  double metersPerUnit() const;

  // Fully composed subtree at an absolute path. Throws ParseError when no spec exists there.
  Prim compose(const std::string& path);

  static constexpr int kMaxCompositionDepth = 64;

private:
  using LayerStack = std::vector<const Layer*>;

  struct Node
  {
    const LayerStack* stack = nullptr;
    std::string path;      // path in the stack's namespace
    std::string map_from;  // source namespace prefix
    std::string map_to;    // stage namespace prefix
  };

  const Layer& layerForFile(const std::string& filename);
  const LayerStack& stackFor(const Layer& root);
  void collectSublayers(const Layer& layer, LayerStack& stack, std::vector<std::string>& visiting);

  void expand(const Node& node, std::vector<Node>& out, std::vector<std::string>& chain, int depth);
  Prim composeIndex(const std::vector<Node>& nodes, const std::string& stage_path, int depth);
  std::string mapPath(const Node& node, const std::string& source_path) const;

  std::map<std::string, std::unique_ptr<Layer>> layers;
  std::map<const Layer*, std::unique_ptr<LayerStack>> stacks;
  const Layer* root_layer = nullptr;
};

}  // namespace usd
}  // namespace robodiff

#endif  // ROBODIFF_USD_STAGE_H_
