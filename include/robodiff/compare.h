#ifndef ROBODIFF_COMPARE_H_
#define ROBODIFF_COMPARE_H_

#include <optional>
#include <set>
#include <string>

#include <robodiff/diff/diff_engine.h>
#include <robodiff/model/canonical_model.h>

namespace robodiff {

struct CompareOptions
{
  diff::DiffOptions diff;
  std::optional<model::ModelFormat> format_a;  // detected from the extension when unset
  std::optional<model::ModelFormat> format_b;
};

enum class CompareStatus
{
  Equivalent,
  Different,
  Failed,
};

struct CompareOutcome
{
  CompareStatus status = CompareStatus::Failed;
  std::optional<diff::DiffReport> report;  // set unless the comparison failed
  std::string error;                       // set when it failed
};

// .urdf, .sdf, .xml/.mjcf, .usda/.usd. Throws FormatDetectionError otherwise.
model::ModelFormat detectFormat(const std::string& filename);

// Field categories the adapter for a format is able to populate.
std::set<diff::FieldCategory> formatCapabilities(model::ModelFormat format);

// Throws ComparisonScopeError when a requested category cannot be populated by one of the formats.
void validateScope(const diff::DiffOptions& options, model::ModelFormat format_a, model::ModelFormat format_b);

// Comma separated category names ("kinematics,inertial"). Throws ComparisonScopeError on unknown names.
std::set<diff::FieldCategory> parseFieldList(const std::string& list);

// Parse one model file with the adapter for its format.
model::CanonicalModel loadModel(const std::string& filename, std::optional<model::ModelFormat> format = std::nullopt);

/**
 * @brief Parse both files and diff them.
 *
 * @throws FormatDetectionError, ComparisonScopeError (before parsing), ParseError
 */
diff::DiffReport compareFiles(const std::string& path_a, const std::string& path_b,
                              const CompareOptions& options = CompareOptions());

// Same as compareFiles, with failures turned into a Failed outcome.
CompareOutcome compare(const std::string& path_a, const std::string& path_b,
                       const CompareOptions& options = CompareOptions());

std::string compareStatusToString(CompareStatus status);

}  // namespace robodiff

#endif  // ROBODIFF_COMPARE_H_
