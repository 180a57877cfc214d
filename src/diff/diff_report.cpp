#include <robodiff/diff/diff_report.h>

#include <algorithm>
#include <sstream>
#include <tuple>

namespace robodiff {
namespace diff {

namespace {

std::string formatNumber(double value)
{
  std::ostringstream ss;
  ss.precision(10);
  ss << value;
  return ss.str();
}

}  // namespace

bool operator<(const DiffEntry& a, const DiffEntry& b)
{
  return std::tie(a.entity_kind, a.entity_id, a.field_path) < std::tie(b.entity_kind, b.entity_id, b.field_path);
}

void DiffReport::sort()
{
  std::stable_sort(entries.begin(), entries.end());
}

std::string entityKindToString(EntityKind kind)
{
  switch (kind)
  {
    case EntityKind::Link:
      return "link";
    case EntityKind::Joint:
      return "joint";
  }
  return "unknown";
}

std::string classificationToString(Classification classification)
{
  switch (classification)
  {
    case Classification::Mismatch:
      return "mismatch";
    case Classification::AddedInB:
      return "added_in_b";
    case Classification::RemovedFromB:
      return "removed_from_b";
    case Classification::UnmatchedStructure:
      return "unmatched_structure";
  }
  return "unknown";
}

std::string modelSideToString(ModelSide side)
{
  return side == ModelSide::A ? "A" : "B";
}

std::string formatValue(const DiffValue& value)
{
  if (std::holds_alternative<double>(value))
    return formatNumber(std::get<double>(value));

  if (std::holds_alternative<std::vector<double>>(value))
  {
    std::string str = "(";
    const auto& v = std::get<std::vector<double>>(value);
    for (std::size_t i = 0; i < v.size(); ++i)
    {
      if (i > 0)
        str += ", ";
      str += formatNumber(v[i]);
    }
    return str + ")";
  }

  if (std::holds_alternative<std::string>(value))
    return std::get<std::string>(value);

  return "none";
}

std::ostream& operator<<(std::ostream& os, EntityKind kind)
{
  return os << entityKindToString(kind);
}

std::ostream& operator<<(std::ostream& os, Classification classification)
{
  return os << classificationToString(classification);
}

std::ostream& operator<<(std::ostream& os, const DiffEntry& entry)
{
  os << entry.entity_kind << " '" << entry.entity_id << "'";
  if (!entry.field_path.empty())
    os << " " << entry.field_path;
  return os << ": " << entry.classification << " [" << formatValue(entry.value_a) << " | "
            << formatValue(entry.value_b) << "]";
}

}  // namespace diff
}  // namespace robodiff
