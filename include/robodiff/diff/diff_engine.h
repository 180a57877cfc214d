#ifndef ROBODIFF_DIFF_DIFF_ENGINE_H_
#define ROBODIFF_DIFF_DIFF_ENGINE_H_

#include <set>
#include <string>

#include <robodiff/diff/alignment.h>
#include <robodiff/diff/diff_report.h>
#include <robodiff/uri_resolver.h>

namespace robodiff {
namespace diff {

enum class FieldCategory
{
  Kinematics,  // entity presence, kind, origin, axis
  Inertial,
  Collision,
  Visual,
};

enum class ToleranceMode
{
  Absolute,
  Relative,
};

struct DiffOptions
{
  double tolerance_linear = 1e-6;
  double tolerance_angular = 1e-6;  // radians
  ToleranceMode tolerance_mode = ToleranceMode::Absolute;
  bool include_visual = false;
  std::set<FieldCategory> fields;  // empty: every category but visual
  MeshReferenceMode mesh_reference_mode = MeshReferenceMode::FileName;
};

// Categories a diff with these options compares.
std::set<FieldCategory> effectiveCategories(const DiffOptions& options);

// True when a and b differ by more than the tolerance. Relative mode scales it by max(|a|, |b|).
bool exceedsTolerance(double a, double b, double tolerance, ToleranceMode mode);

/**
 * @brief Semantic diff of two canonical models.
 *
 * Entities are aligned by name; matched pairs are compared field by field under the tolerances of
 * @p options. Entries come out sorted (links before joints, then name, then field path) and the
 * warnings of both models are attached.
 */
DiffReport diffModels(const model::CanonicalModel& a, const model::CanonicalModel& b,
                      const DiffOptions& options = DiffOptions());

FieldCategory fieldCategoryFromString(const std::string& str);
std::string fieldCategoryToString(FieldCategory category);

ToleranceMode toleranceModeFromString(const std::string& str);
std::string toleranceModeToString(ToleranceMode mode);

std::ostream& operator<<(std::ostream& os, FieldCategory category);

}  // namespace diff
}  // namespace robodiff

#endif  // ROBODIFF_DIFF_DIFF_ENGINE_H_
