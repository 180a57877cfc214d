#ifndef ROBODIFF_ADAPTERS_URDF_PARSER_H_
#define ROBODIFF_ADAPTERS_URDF_PARSER_H_

#include <memory>
#include <string>

#include <tinyxml2.h>

#include <robodiff/adapters/model_parser.h>

namespace robodiff {
namespace adapters {

/**
 * @brief URDF adapter.
 *
 * Poses are xyz + fixed-axis rpy, geometry extents are already full extents, joint frames coincide
 * with child link frames. Materials, transmissions, gazebo extensions, limits and dynamics are skipped.
 */
class UrdfParser : public ModelParser
{
public:
  UrdfParser();
  ~UrdfParser() override;

  model::CanonicalModel loadModelFromText(const std::string& text, const std::string& base_dir = "",
                                          const std::string& source_name = "<text>") override;

  model::ModelFormat format() const override
  {
    return model::ModelFormat::Urdf;
  }

private:
  model::Link parseLink(const tinyxml2::XMLElement* elem, model::CanonicalModel& model) const;
  model::Inertial parseInertial(const tinyxml2::XMLElement* elem) const;
  void parseGeometryInstances(const tinyxml2::XMLElement* link_elem, const char* tag,
                              std::vector<model::GeometryInstance>& out, model::CanonicalModel& model) const;
  geometry::Shape parseGeometry(const tinyxml2::XMLElement* elem) const;
  model::Joint parseJoint(const tinyxml2::XMLElement* elem) const;
  geometry::Pose parseOrigin(const tinyxml2::XMLElement* parent) const;

  std::string filename;

  /// Document being parsed (lifetime is managed).
  std::unique_ptr<tinyxml2::XMLDocument> doc;
};

}  // namespace adapters
}  // namespace robodiff

#endif  // ROBODIFF_ADAPTERS_URDF_PARSER_H_
