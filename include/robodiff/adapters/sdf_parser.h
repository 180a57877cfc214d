#ifndef ROBODIFF_ADAPTERS_SDF_PARSER_H_
#define ROBODIFF_ADAPTERS_SDF_PARSER_H_

#include <map>
#include <memory>
#include <set>
#include <string>

#include <Eigen/Geometry>
#include <tinyxml2.h>

#include <robodiff/adapters/model_parser.h>

namespace robodiff {
namespace adapters {

/**
 * @brief SDFormat adapter.
 *
 * Link, joint and explicit frame poses are resolved to the model frame through their
 * relative_to / attached_to chains, then re-expressed parent-relative. Joint frames may differ
 * from child link frames in SDFormat; the canonical origin is always the child link frame.
 */
class SdfParser : public ModelParser
{
public:
  SdfParser();
  ~SdfParser() override;

  model::CanonicalModel loadModelFromText(const std::string& text, const std::string& base_dir = "",
                                          const std::string& source_name = "<text>") override;

  model::ModelFormat format() const override
  {
    return model::ModelFormat::Sdf;
  }

private:
  struct FrameSpec
  {
    const tinyxml2::XMLElement* elem = nullptr;
    std::string default_relative_to;
  };

  void registerFrames(const tinyxml2::XMLElement* model_elem);
  Eigen::Isometry3d resolveFrame(const std::string& name, const tinyxml2::XMLElement* context);

  // Pose of an element's <pose> child in the frame of `link`, honouring relative_to.
  geometry::Pose poseInLink(const tinyxml2::XMLElement* elem, const std::string& link);
  Eigen::Isometry3d parsePose(const tinyxml2::XMLElement* pose_elem) const;

  model::Link parseLink(const tinyxml2::XMLElement* elem, model::CanonicalModel& model);
  model::Inertial parseInertial(const tinyxml2::XMLElement* elem, const std::string& link);
  void parseGeometryInstances(const tinyxml2::XMLElement* link_elem, const char* tag, const std::string& link,
                              std::vector<model::GeometryInstance>& out, model::CanonicalModel& model);
  geometry::Shape parseGeometry(const tinyxml2::XMLElement* elem) const;
  bool parseJoint(const tinyxml2::XMLElement* elem, model::CanonicalModel& model, model::Joint& joint);

  std::string filename;
  std::map<std::string, FrameSpec> frames;
  std::map<std::string, Eigen::Isometry3d> resolved;
  std::set<std::string> resolving;

  /// Document being parsed (lifetime is managed).
  std::unique_ptr<tinyxml2::XMLDocument> doc;
};

}  // namespace adapters
}  // namespace robodiff

#endif  // ROBODIFF_ADAPTERS_SDF_PARSER_H_
