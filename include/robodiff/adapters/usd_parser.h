#ifndef ROBODIFF_ADAPTERS_USD_PARSER_H_
#define ROBODIFF_ADAPTERS_USD_PARSER_H_

#include <map>
#include <optional>
#include <set>
#include <string>

#include <Eigen/Geometry>

#include <robodiff/adapters/model_parser.h>
#include <robodiff/usd/stage.h>

namespace robodiff {
namespace adapters {

/**
 * @brief USD (text encoding) adapter for physics robots.
 *
 * The robot is the stage's default prim. Links are the prims listed by isaac:physics:robotLinks,
 * or every prim with PhysicsRigidBodyAPI; joints are the prims listed by isaac:physics:robotJoints,
 * or every Physics*Joint prim. Gprims below a link (not crossing into another rigid body) are
 * collisions when PhysicsCollisionAPI is applied on them or on an intermediate prim, visuals
 * otherwise. Lengths are converted with the root layer's metersPerUnit.
 */
class UsdParser : public ModelParser
{
public:
  UsdParser();
  ~UsdParser() override;

  model::CanonicalModel loadModelFromFile(const std::string& filename) override;
  model::CanonicalModel loadModelFromText(const std::string& text, const std::string& base_dir = "",
                                          const std::string& source_name = "<text>") override;

  model::ModelFormat format() const override
  {
    return model::ModelFormat::Usd;
  }

private:
  model::CanonicalModel buildModel(usd::Stage& stage, const std::string& source);
  void indexPrims(const usd::Prim& prim);

  model::Link parseLink(const usd::Prim& prim, model::CanonicalModel& model) const;
  std::optional<model::Inertial> parseInertial(const usd::Prim& prim, model::CanonicalModel& model) const;
  void collectGeometry(const usd::Prim& prim, const Eigen::Affine3d& link_from_prim, bool collision,
                       const std::string& mesh_asset, model::Link& link, model::CanonicalModel& model) const;
  geometry::Shape parseGprim(const usd::Prim& prim, const Eigen::Affine3d& link_from_prim, const std::string& mesh_asset,
                             geometry::Pose& pose) const;
  Eigen::Affine3d localTransform(const usd::Prim& prim) const;
  bool parseJoint(const usd::Prim& prim, model::CanonicalModel& model, model::Joint& joint) const;
  std::string bodyLink(const usd::Prim& joint_prim, const char* rel_name) const;

  std::string source;
  std::string robot_path;
  double meters_per_unit = 1.0;
  usd::Prim robot;
  std::map<std::string, const usd::Prim*> prims;  // stage path -> composed prim
  std::set<std::string> link_paths;
};

}  // namespace adapters
}  // namespace robodiff

#endif  // ROBODIFF_ADAPTERS_USD_PARSER_H_
