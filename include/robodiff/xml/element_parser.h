#ifndef ROBODIFF_XML_ELEMENT_PARSER_H_
#define ROBODIFF_XML_ELEMENT_PARSER_H_

#include <string>
#include <vector>

#include <Eigen/Core>
#include <tinyxml2.h>

namespace robodiff {
namespace xml {

// All helpers throw ParseError located at "file:line" of the element.

/**
 * @brief Parse whitespace separated numbers ("1 2.5 -3e-2").
 * @param expected if non-zero, the exact count required.
 */
std::vector<double> parseNumberList(const std::string& text, const std::string& where, std::size_t expected = 0);

const tinyxml2::XMLElement* reqChild(const tinyxml2::XMLElement* parent, const char* name, const std::string& file);
const char* reqAttribute(const tinyxml2::XMLElement* elem, const char* name, const std::string& file);

double reqNumberAttribute(const tinyxml2::XMLElement* elem, const char* name, const std::string& file);
double numberAttribute(const tinyxml2::XMLElement* elem, const char* name, double default_value,
                       const std::string& file);

// Exactly n numbers from an attribute, or the default when the attribute is absent.
std::vector<double> numbersAttribute(const tinyxml2::XMLElement* elem, const char* name, std::size_t n,
                                     const std::vector<double>& default_value, const std::string& file);

Eigen::Vector3d vector3Attribute(const tinyxml2::XMLElement* elem, const char* name,
                                 const Eigen::Vector3d& default_value, const std::string& file);

// Text of a child element ("" when absent), trimmed.
std::string childText(const tinyxml2::XMLElement* parent, const char* name);
double reqChildNumber(const tinyxml2::XMLElement* parent, const char* name, const std::string& file);
double childNumber(const tinyxml2::XMLElement* parent, const char* name, double default_value,
                   const std::string& file);

std::string trim(const std::string& s);

}  // namespace xml
}  // namespace robodiff

#endif  // ROBODIFF_XML_ELEMENT_PARSER_H_
