#include <robodiff/usd/stage.h>

#include <algorithm>
#include <filesystem>

#include <robodiff/errors.h>
#include <robodiff/uri_resolver.h>

namespace robodiff {
namespace usd {

namespace {

std::string layerKey(const std::string& path)
{
  std::error_code ec;
  auto abs = std::filesystem::absolute(path, ec);
  return (ec ? std::filesystem::path(path) : abs).lexically_normal().generic_string();
}

void appendUnique(std::vector<std::string>& list, const std::string& item)
{
  if (std::find(list.begin(), list.end(), item) == list.end())
    list.push_back(item);
}

std::string resolveRelativePath(const std::string& anchor, const std::string& target)
{
  if (target.empty() || target[0] == '/')
    return target;
  return std::filesystem::path(anchor + "/" + target).lexically_normal().generic_string();
}

}  // namespace

bool Prim::hasApi(const std::string& schema) const
{
  return std::find(api_schemas.begin(), api_schemas.end(), schema) != api_schemas.end();
}

const Attribute* Prim::attribute(const std::string& attr_name) const
{
  auto it = attributes.find(attr_name);
  if (it == attributes.end() || !it->second.has_value)
    return nullptr;
  return &it->second;
}

const std::vector<std::string>* Prim::relationship(const std::string& rel_name) const
{
  auto it = relationships.find(rel_name);
  return it == relationships.end() ? nullptr : &it->second;
}

const Prim* Prim::child(const std::string& child_name) const
{
  for (const auto& c : children)
  {
    if (c.name == child_name)
      return &c;
  }
  return nullptr;
}

std::string Prim::where() const
{
  return layer + ":" + std::to_string(line) + ":" + path;
}

Stage::Stage() = default;
Stage::~Stage() = default;

void Stage::openFile(const std::string& filename)
{
  root_layer = &layerForFile(filename);
}

void Stage::openText(const std::string& text, const std::string& directory, const std::string& identifier)
{
  auto layer = std::make_unique<Layer>(parseLayer(text, identifier, directory));
  root_layer = layer.get();
  layers[identifier] = std::move(layer);
}

std::string Stage::robotPrimPath() const
{
  if (!root_layer)
    throw ParseError("", "no layer opened");
  if (!root_layer->default_prim.empty())
    return "/" + root_layer->default_prim;

  for (const auto& p : root_layer->root_prims)
  {
    if (p.specifier == Specifier::Def)
      return "/" + p.name;
  }
  throw ParseError(root_layer->identifier, "layer has no defaultPrim and no root prim");
}

double Stage::metersPerUnit() const
{
  return root_layer && root_layer->meters_per_unit ? *root_layer->meters_per_unit : 1.0;
}

Prim Stage::compose(const std::string& path)
{
  if (!root_layer)
    throw ParseError("", "no layer opened");

  Node root{ &stackFor(*root_layer), path, "", "" };
  std::vector<Node> nodes;
  std::vector<std::string> chain;
  expand(root, nodes, chain, 0);
  return composeIndex(nodes, path, 0);
}

const Layer& Stage::layerForFile(const std::string& filename)
{
  const std::string key = layerKey(filename);
  auto it = layers.find(key);
  if (it != layers.end())
    return *it->second;

  auto layer = std::make_unique<Layer>(loadLayer(key));
  const Layer& ref = *layer;
  layers[key] = std::move(layer);
  return ref;
}

const Stage::LayerStack& Stage::stackFor(const Layer& root)
{
  auto it = stacks.find(&root);
  if (it != stacks.end())
    return *it->second;

  auto stack = std::make_unique<LayerStack>();
  std::vector<std::string> visiting = { layerKey(root.identifier) };
  collectSublayers(root, *stack, visiting);

  const LayerStack& ref = *stack;
  stacks[&root] = std::move(stack);
  return ref;
}

void Stage::collectSublayers(const Layer& layer, LayerStack& stack, std::vector<std::string>& visiting)
{
  stack.push_back(&layer);
  for (const auto& sub : layer.sublayers)
  {
    const std::string path = joinReference(layer.directory, sub);
    const std::string key = layerKey(path);
    if (std::find(visiting.begin(), visiting.end(), key) != visiting.end())
      throw ParseError(layer.identifier, "sublayer cycle through '" + sub + "'");
    if (static_cast<int>(visiting.size()) > kMaxCompositionDepth)
      throw ParseError(layer.identifier, "sublayers nested too deep");

    visiting.push_back(key);
    collectSublayers(layerForFile(path), stack, visiting);
    visiting.pop_back();
  }
}

std::string Stage::mapPath(const Node& node, const std::string& source_path) const
{
  if (node.map_from.empty() || node.map_from == node.map_to)
    return source_path;
  if (source_path == node.map_from)
    return node.map_to;
  if (source_path.rfind(node.map_from + "/", 0) == 0)
    return node.map_to + source_path.substr(node.map_from.size());
  return source_path;
}

void Stage::expand(const Node& node, std::vector<Node>& out, std::vector<std::string>& chain, int depth)
{
  const std::string key = node.stack->front()->identifier + "@" + node.path;
  if (std::find(chain.begin(), chain.end(), key) != chain.end())
    throw ParseError(node.stack->front()->identifier + ":" + node.path, "composition cycle at '" + node.path + "'");
  if (depth > kMaxCompositionDepth)
    throw ParseError(node.stack->front()->identifier + ":" + node.path, "composition arcs nested too deep");

  out.push_back(node);
  chain.push_back(key);

  const std::string stage_path = mapPath(node, node.path);
  std::vector<Node> inherited;
  std::vector<Node> referenced;
  std::vector<Node> payloads;

  auto arcNode = [&](const Layer& layer, const Arc& arc) -> Node {
    if (arc.asset.empty())
    {
      if (arc.prim_path.empty())
        throw ParseError(layer.identifier + ":" + node.path, "internal reference without a prim path");
      return Node{ node.stack, arc.prim_path, arc.prim_path, stage_path };
    }

    const Layer& target_layer = layerForFile(joinReference(layer.directory, arc.asset));
    std::string target = arc.prim_path;
    if (target.empty())
    {
      if (target_layer.default_prim.empty())
        throw ParseError(layer.identifier + ":" + node.path,
                         "reference to '" + arc.asset + "' needs a prim path (no defaultPrim)");
      target = "/" + target_layer.default_prim;
    }
    return Node{ &stackFor(target_layer), target, target, stage_path };
  };

  for (const Layer* layer : *node.stack)
  {
    const PrimSpec* spec = layer->findPrim(node.path);
    if (!spec)
      continue;
    for (const auto& path : spec->inherits)
      inherited.push_back(Node{ node.stack, path, path, stage_path });
    for (const auto& arc : spec->references)
      referenced.push_back(arcNode(*layer, arc));
    for (const auto& arc : spec->payloads)
      payloads.push_back(arcNode(*layer, arc));
  }

  for (const auto& n : inherited)
    expand(n, out, chain, depth + 1);
  for (const auto& n : referenced)
    expand(n, out, chain, depth + 1);
  for (const auto& n : payloads)
    expand(n, out, chain, depth + 1);

  chain.pop_back();
}

Prim Stage::composeIndex(const std::vector<Node>& nodes, const std::string& stage_path, int depth)
{
  if (depth > kMaxCompositionDepth)
    throw ParseError(stage_path, "prim hierarchy nested too deep (composition cycle?)");

  Prim prim;
  prim.path = stage_path;
  prim.name = stage_path.substr(stage_path.find_last_of('/') + 1);

  std::vector<std::string> child_names;
  bool any = false;
  for (const auto& node : nodes)
  {
    for (const Layer* layer : *node.stack)
    {
      const PrimSpec* spec = layer->findPrim(node.path);
      if (!spec)
        continue;

      if (!any)
      {
        any = true;
        prim.layer = layer->identifier;
        prim.line = spec->line;
      }
      if (spec->specifier == Specifier::Def)
        prim.specifier = Specifier::Def;
      else if (spec->specifier == Specifier::Class && prim.specifier == Specifier::Over)
        prim.specifier = Specifier::Class;
      if (prim.type_name.empty())
        prim.type_name = spec->type_name;

      for (const auto& api : spec->api_schemas)
        appendUnique(prim.api_schemas, api);
      for (const auto& [name, attr] : spec->attributes)
        prim.attributes.emplace(name, attr);
      for (const auto& [name, rel] : spec->relationships)
      {
        if (prim.relationships.count(name))
          continue;
        std::vector<std::string> targets;
        for (const auto& t : rel.targets)
          targets.push_back(mapPath(node, resolveRelativePath(node.path, t)));
        prim.relationships.emplace(name, std::move(targets));
      }
      for (const auto* arcs : { &spec->references, &spec->payloads })
      {
        for (const auto& arc : *arcs)
        {
          if (!arc.asset.empty())
            appendUnique(prim.referenced_assets, joinReference(layer->directory, arc.asset));
        }
      }
      for (const auto& c : spec->children)
        appendUnique(child_names, c.name);
    }
  }

  if (!any)
    throw ParseError(stage_path, "no prim spec at '" + stage_path + "'");

  for (const auto& child_name : child_names)
  {
    std::vector<Node> child_nodes;
    std::vector<std::string> chain;
    for (const auto& node : nodes)
    {
      Node c{ node.stack, node.path + "/" + child_name, node.map_from, node.map_to };
      bool has_spec = false;
      for (const Layer* layer : *c.stack)
        has_spec = has_spec || layer->findPrim(c.path) != nullptr;
      if (has_spec)
        expand(c, child_nodes, chain, 0);
    }

    Prim child = composeIndex(child_nodes, stage_path + "/" + child_name, depth + 1);
    if (child.specifier == Specifier::Def)
      prim.children.push_back(std::move(child));
  }
  return prim;
}

}  // namespace usd
}  // namespace robodiff
