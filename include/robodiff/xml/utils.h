#ifndef ROBODIFF_XML_UTILS_H_
#define ROBODIFF_XML_UTILS_H_

#include <memory>
#include <string>

#include <tinyxml2.h>

#include <robodiff/model/canonical_model.h>

namespace robodiff {
namespace xml {

/**
 * @brief Load and parse an XML file.
 * @throws ParseError when the file cannot be read or is not well-formed XML.
 */
std::unique_ptr<tinyxml2::XMLDocument> loadDocumentFromFile(const std::string& filename);

// Same as loadDocumentFromFile for in-memory text; source_name is used in error locations.
std::unique_ptr<tinyxml2::XMLDocument> loadDocumentFromText(const std::string& text, const std::string& source_name);

model::SourceLocation locationOf(const tinyxml2::XMLElement* elem, const std::string& file);

// "file:line" of an element, for error messages.
std::string where(const tinyxml2::XMLElement* elem, const std::string& file);

}  // namespace xml
}  // namespace robodiff

#endif  // ROBODIFF_XML_UTILS_H_
