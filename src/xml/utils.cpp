#include <robodiff/xml/utils.h>

#include <iostream>

#include <robodiff/errors.h>

namespace robodiff {
namespace xml {

std::unique_ptr<tinyxml2::XMLDocument> loadDocumentFromFile(const std::string& filename)
{
  auto doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->LoadFile(filename.c_str()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "ERROR: loading XML file: " << filename << std::endl;
    throw ParseError(filename + (doc->ErrorLineNum() > 0 ? ":" + std::to_string(doc->ErrorLineNum()) : ""),
                     std::string("failed to load XML: ") + doc->ErrorStr());
  }
  return doc;
}

std::unique_ptr<tinyxml2::XMLDocument> loadDocumentFromText(const std::string& text, const std::string& source_name)
{
  auto doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->Parse(text.c_str(), text.size()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "ERROR: parsing XML text: " << source_name << std::endl;
    throw ParseError(source_name + (doc->ErrorLineNum() > 0 ? ":" + std::to_string(doc->ErrorLineNum()) : ""),
                     std::string("failed to parse XML: ") + doc->ErrorStr());
  }
  return doc;
}

model::SourceLocation locationOf(const tinyxml2::XMLElement* elem, const std::string& file)
{
  model::SourceLocation loc;
  loc.file = file;
  loc.line = elem ? elem->GetLineNum() : 0;
  return loc;
}

std::string where(const tinyxml2::XMLElement* elem, const std::string& file)
{
  return locationOf(elem, file).toString();
}

}  // namespace xml
}  // namespace robodiff
