#include <robodiff/adapters/model_parser.h>

#include <robodiff/adapters/mjcf_parser.h>
#include <robodiff/adapters/sdf_parser.h>
#include <robodiff/adapters/urdf_parser.h>
#include <robodiff/adapters/usd_parser.h>
#include <robodiff/errors.h>
#include <robodiff/uri_resolver.h>

namespace robodiff {
namespace adapters {

model::CanonicalModel ModelParser::loadModelFromFile(const std::string& filename)
{
  return loadModelFromText(readFile(filename), getDirectory(filename), filename);
}

std::unique_ptr<ModelParser> makeParser(model::ModelFormat format)
{
  switch (format)
  {
    case model::ModelFormat::Urdf:
      return std::make_unique<UrdfParser>();
    case model::ModelFormat::Sdf:
      return std::make_unique<SdfParser>();
    case model::ModelFormat::Mjcf:
      return std::make_unique<MjcfParser>();
    case model::ModelFormat::Usd:
      return std::make_unique<UsdParser>();
  }
  throw std::runtime_error("no parser for format " + model::modelFormatToString(format));
}

void recordUnsupported(model::CanonicalModel& model, const model::SourceLocation& location,
                       const UnsupportedElementError& error, const std::string& note)
{
  std::string message = "unsupported element '" + error.element() + "'";
  if (!note.empty())
    message += ", " + note;
  model.addWarning(location, message);
}

}  // namespace adapters
}  // namespace robodiff
