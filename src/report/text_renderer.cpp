#include <robodiff/report/text_renderer.h>

#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace robodiff {
namespace report {

namespace {

const char* kRed = "\033[31m";
const char* kGreen = "\033[32m";
const char* kReset = "\033[0m";

enum class EntityStatus
{
  Added,
  Removed,
  Modified,
};

struct EntityDiff
{
  diff::EntityKind kind;
  std::string name;
  EntityStatus status = EntityStatus::Modified;
  std::vector<const diff::DiffEntry*> changes;
};

struct Counts
{
  int removed = 0;
  int added = 0;
  int modified = 0;
};

// Entries are sorted, so entities come out links first, then by name.
std::vector<EntityDiff> groupEntries(const diff::DiffReport& report)
{
  std::vector<EntityDiff> entities;
  for (const auto& e : report.entries)
  {
    if (entities.empty() || entities.back().kind != e.entity_kind || entities.back().name != e.entity_id)
      entities.push_back(EntityDiff{ e.entity_kind, e.entity_id, EntityStatus::Modified, {} });

    EntityDiff& entity = entities.back();
    if (e.field_path.empty() && e.classification == diff::Classification::AddedInB)
      entity.status = EntityStatus::Added;
    else if (e.field_path.empty() && e.classification == diff::Classification::RemovedFromB)
      entity.status = EntityStatus::Removed;
    else
      entity.changes.push_back(&e);
  }
  return entities;
}

Counts countEntities(const std::vector<EntityDiff>& entities, std::optional<diff::EntityKind> kind = std::nullopt)
{
  Counts counts;
  for (const auto& e : entities)
  {
    if (kind && e.kind != *kind)
      continue;
    switch (e.status)
    {
      case EntityStatus::Removed:
        ++counts.removed;
        break;
      case EntityStatus::Added:
        ++counts.added;
        break;
      case EntityStatus::Modified:
        ++counts.modified;
        break;
    }
  }
  return counts;
}

std::string entityLabel(diff::EntityKind kind)
{
  return kind == diff::EntityKind::Link ? "Link" : "Joint";
}

std::string fieldLabel(const diff::DiffEntry& e)
{
  return e.field_path.empty() ? "structure" : e.field_path;
}

class Renderer
{
public:
  explicit Renderer(const RenderOptions& options) : options(options)
  {
  }

  std::string colorize(const std::string& text, const char* color) const
  {
    return options.color ? color + text + kReset : text;
  }

  std::string statusLayout(const diff::DiffReport& report, const std::vector<EntityDiff>& entities) const
  {
    std::ostringstream os;
    os << "━━━ NAME ━━━\n\n";
    if (report.model_a != report.model_b)
      os << colorize(report.model_a, kRed) << " → " << colorize(report.model_b, kGreen) << "\n\n";
    else
      os << report.model_a << " → " << report.model_b << "\n\n";

    const Counts counts = countEntities(entities);
    os << std::string(45, '=') << "\n";
    os << "SUMMARY: " << counts.removed << " removed, " << counts.added << " added, " << counts.modified
       << " modified\n";
    os << std::string(45, '=') << "\n\n";

    simpleSection(os, entities, EntityStatus::Removed, "REMOVED", kRed);
    simpleSection(os, entities, EntityStatus::Added, "ADDED", kGreen);

    bool header = false;
    for (const auto& e : entities)
    {
      if (e.status != EntityStatus::Modified)
        continue;
      if (!header)
      {
        os << "━━━ MODIFIED ━━━\n\n";
        header = true;
      }
      os << entityLabel(e.kind) << ": " << e.name << "\n";
      for (const auto* change : e.changes)
        os << "  • " << fieldLabel(*change) << ": " << describeChange(*change) << "\n";
      os << "\n";
    }
    return os.str();
  }

  std::string gitLayout(const diff::DiffReport& report, const std::vector<EntityDiff>& entities) const
  {
    std::ostringstream os;
    os << "@@ Name @@\n\n";
    if (report.model_a != report.model_b)
    {
      os << colorize("-name: " + report.model_a, kRed) << "\n";
      os << colorize("+name: " + report.model_b, kGreen) << "\n";
    }
    os << "\n";

    for (auto kind : { diff::EntityKind::Link, diff::EntityKind::Joint })
    {
      const Counts counts = countEntities(entities, kind);
      os << "@@ " << entityLabel(kind) << "s (" << counts.removed << " removed, " << counts.added << " added, "
         << counts.modified << " modified) @@\n\n";

      for (const auto& e : entities)
      {
        if (e.kind != kind)
          continue;
        if (e.status == EntityStatus::Removed)
          os << colorize("-" + entityLabel(kind) + " " + e.name, kRed) << "\n";
        else if (e.status == EntityStatus::Added)
          os << colorize("+" + entityLabel(kind) + " " + e.name, kGreen) << "\n";
        else
        {
          os << " " << entityLabel(kind) << " " << e.name << "\n";
          for (const auto* change : e.changes)
            gitChange(os, *change);
        }
        os << "\n";
      }
    }
    return os.str();
  }

private:
  void simpleSection(std::ostringstream& os, const std::vector<EntityDiff>& entities, EntityStatus status,
                     const std::string& title, const char* color) const
  {
    bool header = false;
    for (const auto& e : entities)
    {
      if (e.status != status)
        continue;
      if (!header)
      {
        os << "━━━ " << title << " ━━━\n\n";
        header = true;
      }
      os << entityLabel(e.kind) << ": " << colorize(e.name, color) << "\n";
    }
    if (header)
      os << "\n";
  }

  std::string describeChange(const diff::DiffEntry& e) const
  {
    switch (e.classification)
    {
      case diff::Classification::AddedInB:
        return colorize("added", kGreen);
      case diff::Classification::RemovedFromB:
        return colorize("removed", kRed);
      default:
        return colorize(diff::formatValue(e.value_a), kRed) + " → " + colorize(diff::formatValue(e.value_b), kGreen);
    }
  }

  void gitChange(std::ostringstream& os, const diff::DiffEntry& e) const
  {
    const std::string path = fieldLabel(e);
    if (e.classification != diff::Classification::AddedInB)
      os << colorize("-  " + path + ": " + diff::formatValue(e.value_a), kRed) << "\n";
    if (e.classification != diff::Classification::RemovedFromB)
      os << colorize("+  " + path + ": " + diff::formatValue(e.value_b), kGreen) << "\n";
  }

  const RenderOptions& options;
};

std::string trimTrailingNewlines(std::string text)
{
  while (!text.empty() && text.back() == '\n')
    text.pop_back();
  return text;
}

}  // namespace

std::string renderReport(const diff::DiffReport& report, const RenderOptions& options)
{
  const std::vector<EntityDiff> entities = groupEntries(report);
  Renderer renderer(options);

  std::string text = options.layout == Layout::Git ? renderer.gitLayout(report, entities) :
                                                     renderer.statusLayout(report, entities);
  text = trimTrailingNewlines(text) + "\n";

  if (options.warnings && !report.warnings.empty())
    text += "\n━━━ WARNINGS ━━━\n\n" + renderWarnings(report);
  return text;
}

std::string renderWarnings(const diff::DiffReport& report)
{
  std::ostringstream os;
  for (const auto& w : report.warnings)
    os << "[" << diff::modelSideToString(w.side) << "] " << w.warning.location.toString() << ": "
       << w.warning.message << "\n";
  return os.str();
}

Layout layoutFromString(const std::string& str)
{
  if (str == "status")
    return Layout::Status;
  if (str == "git")
    return Layout::Git;
  throw std::runtime_error("Unknown Layout: " + str);
}

std::string layoutToString(Layout layout)
{
  return layout == Layout::Status ? "status" : "git";
}

}  // namespace report
}  // namespace robodiff
