#ifndef ROBODIFF_ADAPTERS_MODEL_PARSER_H_
#define ROBODIFF_ADAPTERS_MODEL_PARSER_H_

#include <memory>
#include <string>

#include <robodiff/errors.h>
#include <robodiff/model/canonical_model.h>

namespace robodiff {
namespace adapters {

/**
 * @brief Base class of the format adapters: source document -> CanonicalModel.
 *
 * Implementations throw ParseError on malformed input or when the result is not a tree, and record
 * unsupported sub-variants as warnings on the returned model.
 */
class ModelParser
{
public:
  virtual ~ModelParser() = default;

  // Loads a model from a file (relative references resolve against the file location)
  virtual model::CanonicalModel loadModelFromFile(const std::string& filename);

  // Loads a model from text (optionally resolve relative references against base_dir)
  virtual model::CanonicalModel loadModelFromText(const std::string& text, const std::string& base_dir = "",
                                                  const std::string& source_name = "<text>") = 0;

  virtual model::ModelFormat format() const = 0;
};

std::unique_ptr<ModelParser> makeParser(model::ModelFormat format);

// Record an unsupported element as a model warning; parsing goes on.
void recordUnsupported(model::CanonicalModel& model, const model::SourceLocation& location,
                       const UnsupportedElementError& error, const std::string& note = "");

}  // namespace adapters
}  // namespace robodiff

#endif  // ROBODIFF_ADAPTERS_MODEL_PARSER_H_
