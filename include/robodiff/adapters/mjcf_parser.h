#ifndef ROBODIFF_ADAPTERS_MJCF_PARSER_H_
#define ROBODIFF_ADAPTERS_MJCF_PARSER_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <tinyxml2.h>

#include <robodiff/adapters/model_parser.h>
#include <robodiff/geometry/frame.h>

namespace robodiff {
namespace adapters {

/**
 * @brief MJCF (MuJoCo XML) adapter.
 *
 * Every named <body> under <worldbody> becomes a link, and the joint declared inside a nested body
 * connects it to its parent body. Default classes, <include> files and the <compiler> angle,
 * eulerseq and meshdir settings are applied before values are normalized.
 */
class MjcfParser : public ModelParser
{
public:
  MjcfParser();
  ~MjcfParser() override;

  model::CanonicalModel loadModelFromText(const std::string& text, const std::string& base_dir = "",
                                          const std::string& source_name = "<text>") override;

  model::ModelFormat format() const override
  {
    return model::ModelFormat::Mjcf;
  }

private:
  struct Compiler
  {
    bool degrees = true;
    std::string eulerseq = "xyz";
    std::string meshdir;
    std::string assetdir;
    bool autolimits = true;
  };

  struct DefaultClass
  {
    std::string parent;
    std::map<std::string, std::map<std::string, std::string>> attributes;  // tag -> name -> value
  };

  struct MeshAsset
  {
    std::string uri;
    Eigen::Vector3d scale = Eigen::Vector3d::Ones();
  };

  // Element placed through zero or more <frame> wrappers.
  struct Framed
  {
    const tinyxml2::XMLElement* elem;
    geometry::Pose offset;
    std::string childclass;
  };

  // Child elements with <include> files spliced in place.
  std::vector<const tinyxml2::XMLElement*> children(const tinyxml2::XMLElement* parent, const char* name = nullptr);
  void spliceInclude(const tinyxml2::XMLElement* include, const char* name,
                     std::vector<const tinyxml2::XMLElement*>& out);
  std::string where(const tinyxml2::XMLElement* elem) const;
  model::SourceLocation locationOf(const tinyxml2::XMLElement* elem) const;

  void parseCompiler(const tinyxml2::XMLElement* elem);
  void parseDefault(const tinyxml2::XMLElement* elem, const std::string& parent_class);
  void parseAssets(const tinyxml2::XMLElement* elem);

  // Attribute on the element itself, else from its class chain; nullptr when unset everywhere.
  const char* attribute(const tinyxml2::XMLElement* elem, const std::string& cls, const char* name) const;
  std::string elementClass(const tinyxml2::XMLElement* elem, const std::string& childclass) const;
  bool classInherits(const std::string& cls, const std::string& ancestor) const;

  std::vector<double> numbers(const tinyxml2::XMLElement* elem, const std::string& cls, const char* name,
                              std::size_t n, const std::vector<double>& default_value) const;
  Eigen::Quaterniond parseOrientation(const tinyxml2::XMLElement* elem, const std::string& cls) const;
  geometry::Pose parseFrame(const tinyxml2::XMLElement* elem, const std::string& cls) const;

  // <name> children of parent, descending into <frame> elements and accumulating their poses.
  void framedChildren(const tinyxml2::XMLElement* parent, const char* name, const geometry::Pose& offset,
                      const std::string& childclass, std::vector<Framed>& out);

  void parseBody(const tinyxml2::XMLElement* elem, const std::string& parent, const std::string& childclass,
                 const geometry::Pose& offset, model::CanonicalModel& model);
  model::Inertial parseInertial(const tinyxml2::XMLElement* elem) const;
  void parseGeom(const tinyxml2::XMLElement* elem, const std::string& childclass, const geometry::Pose& offset,
                 model::Link& link, model::CanonicalModel& model);
  geometry::Shape parseShape(const tinyxml2::XMLElement* elem, const std::string& cls, geometry::Pose& pose) const;
  void parseBodyJoint(const tinyxml2::XMLElement* body, const std::string& parent, const std::string& child,
                      const std::string& childclass, const geometry::Pose& offset, model::CanonicalModel& model);

  std::string filename;
  std::string base_dir;
  Compiler compiler;
  std::map<std::string, DefaultClass> classes;
  std::map<std::string, MeshAsset> meshes;
  int unnamed_bodies = 0;

  /// Main and included documents (lifetime is managed).
  std::vector<std::unique_ptr<tinyxml2::XMLDocument>> docs;
  std::map<const tinyxml2::XMLDocument*, std::string> doc_files;
  std::map<const tinyxml2::XMLElement*, const tinyxml2::XMLDocument*> included;
  std::vector<std::string> include_stack;
};

}  // namespace adapters
}  // namespace robodiff

#endif  // ROBODIFF_ADAPTERS_MJCF_PARSER_H_
