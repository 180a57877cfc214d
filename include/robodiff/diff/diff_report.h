#ifndef ROBODIFF_DIFF_DIFF_REPORT_H_
#define ROBODIFF_DIFF_DIFF_REPORT_H_

#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include <robodiff/model/canonical_model.h>

namespace robodiff {
namespace diff {

enum class EntityKind
{
  Link,
  Joint,
};

enum class Classification
{
  Mismatch,
  AddedInB,
  RemovedFromB,
  UnmatchedStructure,
};

// none | number | vector | text
using DiffValue = std::variant<std::monostate, double, std::vector<double>, std::string>;

struct DiffEntry
{
  EntityKind entity_kind = EntityKind::Link;
  std::string entity_id;
  std::string field_path;  // empty for whole-entity entries
  DiffValue value_a;
  DiffValue value_b;
  Classification classification = Classification::Mismatch;
};

enum class ModelSide
{
  A,
  B,
};

struct ReportWarning
{
  ModelSide side = ModelSide::A;
  model::Warning warning;
};

struct DiffReport
{
  std::string model_a;
  std::string model_b;
  std::vector<DiffEntry> entries;
  std::vector<ReportWarning> warnings;

  bool empty() const
  {
    return entries.empty();
  }

  // Order entries by entity kind (links first), entity name, then field path.
  void sort();
};

bool operator<(const DiffEntry& a, const DiffEntry& b);

std::string entityKindToString(EntityKind kind);
std::string classificationToString(Classification classification);
std::string modelSideToString(ModelSide side);

// Plain text of a value: "none", a number, "(x, y, z)" or the text itself.
std::string formatValue(const DiffValue& value);

std::ostream& operator<<(std::ostream& os, EntityKind kind);
std::ostream& operator<<(std::ostream& os, Classification classification);
std::ostream& operator<<(std::ostream& os, const DiffEntry& entry);

}  // namespace diff
}  // namespace robodiff

#endif  // ROBODIFF_DIFF_DIFF_REPORT_H_
