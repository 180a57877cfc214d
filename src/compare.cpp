#include <robodiff/compare.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>

#include <robodiff/adapters/model_parser.h>
#include <robodiff/errors.h>

namespace robodiff {

namespace {

const std::map<std::string, model::ModelFormat> kExtensions = {
  { ".urdf", model::ModelFormat::Urdf }, { ".sdf", model::ModelFormat::Sdf },  { ".xml", model::ModelFormat::Mjcf },
  { ".mjcf", model::ModelFormat::Mjcf }, { ".usda", model::ModelFormat::Usd }, { ".usd", model::ModelFormat::Usd },
};

const std::set<diff::FieldCategory> kAllCategories = { diff::FieldCategory::Kinematics, diff::FieldCategory::Inertial,
                                                       diff::FieldCategory::Collision, diff::FieldCategory::Visual };

const std::map<model::ModelFormat, std::set<diff::FieldCategory>> kCapabilities = {
  { model::ModelFormat::Urdf, kAllCategories },
  { model::ModelFormat::Sdf, kAllCategories },
  { model::ModelFormat::Mjcf, kAllCategories },
  { model::ModelFormat::Usd, kAllCategories },
};

}  // namespace

model::ModelFormat detectFormat(const std::string& filename)
{
  std::string ext = std::filesystem::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

  auto it = kExtensions.find(ext);
  if (it == kExtensions.end())
    throw FormatDetectionError("cannot detect the model format of '" + filename + "' (extension '" + ext + "')");
  return it->second;
}

std::set<diff::FieldCategory> formatCapabilities(model::ModelFormat format)
{
  return kCapabilities.at(format);
}

void validateScope(const diff::DiffOptions& options, model::ModelFormat format_a, model::ModelFormat format_b)
{
  for (auto category : diff::effectiveCategories(options))
  {
    for (auto format : { format_a, format_b })
    {
      if (!formatCapabilities(format).count(category))
        throw ComparisonScopeError("field category '" + diff::fieldCategoryToString(category) +
                                   "' cannot be populated from " + model::modelFormatToString(format) + " files");
    }
  }
}

std::set<diff::FieldCategory> parseFieldList(const std::string& list)
{
  std::set<diff::FieldCategory> fields;
  std::size_t start = 0;
  while (start <= list.size())
  {
    std::size_t end = list.find(',', start);
    if (end == std::string::npos)
      end = list.size();
    const std::string name = list.substr(start, end - start);
    if (!name.empty())
      fields.insert(diff::fieldCategoryFromString(name));
    start = end + 1;
  }
  return fields;
}

model::CanonicalModel loadModel(const std::string& filename, std::optional<model::ModelFormat> format)
{
  auto parser = adapters::makeParser(format ? *format : detectFormat(filename));
  return parser->loadModelFromFile(filename);
}

diff::DiffReport compareFiles(const std::string& path_a, const std::string& path_b, const CompareOptions& options)
{
  const model::ModelFormat format_a = options.format_a ? *options.format_a : detectFormat(path_a);
  const model::ModelFormat format_b = options.format_b ? *options.format_b : detectFormat(path_b);
  validateScope(options.diff, format_a, format_b);

  const model::CanonicalModel a = loadModel(path_a, format_a);
  const model::CanonicalModel b = loadModel(path_b, format_b);
  return diff::diffModels(a, b, options.diff);
}

CompareOutcome compare(const std::string& path_a, const std::string& path_b, const CompareOptions& options)
{
  CompareOutcome outcome;
  try
  {
    outcome.report = compareFiles(path_a, path_b, options);
    outcome.status = outcome.report->empty() ? CompareStatus::Equivalent : CompareStatus::Different;
  }
  catch (const ParseError& e)
  {
    outcome.error = e.what();
  }
  catch (const FormatDetectionError& e)
  {
    outcome.error = e.what();
  }
  catch (const ComparisonScopeError& e)
  {
    outcome.error = e.what();
  }
  return outcome;
}

std::string compareStatusToString(CompareStatus status)
{
  switch (status)
  {
    case CompareStatus::Equivalent:
      return "equivalent";
    case CompareStatus::Different:
      return "different";
    case CompareStatus::Failed:
      return "failed";
  }
  return "unknown";
}

}  // namespace robodiff
