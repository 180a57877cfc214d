#ifndef ROBODIFF_USD_USDA_READER_H_
#define ROBODIFF_USD_USDA_READER_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace robodiff {
namespace usd {

// Parsed value of the USDA text syntax, untyped.
struct Value
{
  enum class Kind
  {
    None,
    Number,
    String,
    Token,  // bare identifier: None, true, false, enum-like words
    Asset,
    Path,
    Tuple,
    List,
    Dictionary,
  };

  Kind kind = Kind::None;
  double number = 0.0;
  std::string text;            // String, Token, Asset path, Path
  std::string target;          // Asset immediately followed by a prim path
  std::vector<Value> items;    // Tuple, List, Dictionary values
  std::vector<std::string> keys;  // Dictionary keys
};

// Throw std::invalid_argument when the value does not have the expected shape.
double toNumber(const Value& v);
std::vector<double> toNumbers(const Value& v);
Eigen::Vector3d toVector3(const Value& v);
// USD quaternions are written (real, i, j, k).
Eigen::Quaterniond toQuaternion(const Value& v);
Eigen::Matrix4d toMatrix4(const Value& v);
std::string toText(const Value& v);
std::vector<std::string> toTexts(const Value& v);

struct Attribute
{
  std::string type_name;
  bool has_value = false;
  Value value;
  int line = 0;
};

struct Relationship
{
  std::vector<std::string> targets;
  int line = 0;
};

// Composition arc. Empty asset means an internal arc within the same layer stack.
struct Arc
{
  std::string asset;
  std::string prim_path;
};

enum class Specifier
{
  Def,
  Over,
  Class,
};

struct PrimSpec
{
  Specifier specifier = Specifier::Def;
  std::string type_name;
  std::string name;
  int line = 0;

  std::vector<std::string> api_schemas;
  std::vector<Arc> references;
  std::vector<Arc> payloads;
  std::vector<std::string> inherits;

  std::map<std::string, Attribute> attributes;
  std::map<std::string, Relationship> relationships;
  std::vector<PrimSpec> children;

  const PrimSpec* child(const std::string& child_name) const;
};

/**
 * @brief One .usda layer: layer metadata and the tree of prim specs it authors.
 */
struct Layer
{
  std::string identifier;
  std::string directory;
  std::string default_prim;
  std::optional<double> meters_per_unit;
  std::vector<std::string> sublayers;
  std::vector<PrimSpec> root_prims;

  // Spec at an absolute path ("/robot/base"), nullptr when the layer has no opinion there.
  const PrimSpec* findPrim(const std::string& path) const;
};

/**
 * @brief Parse USDA text.
 * @throws ParseError with "identifier:line" on syntax errors, and on binary (crate or zip) content.
 */
Layer parseLayer(const std::string& text, const std::string& identifier, const std::string& directory);

// Read and parse a layer file.
Layer loadLayer(const std::string& filename);

}  // namespace usd
}  // namespace robodiff

#endif  // ROBODIFF_USD_USDA_READER_H_
