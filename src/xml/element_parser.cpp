#include <robodiff/xml/element_parser.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>

#include <robodiff/errors.h>
#include <robodiff/xml/utils.h>

namespace robodiff {
namespace xml {

std::string trim(const std::string& s)
{
  const char* ws = " \t\r\n";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

std::vector<double> parseNumberList(const std::string& text, const std::string& where, std::size_t expected)
{
  std::vector<double> out;
  const char* p = text.c_str();
  while (true)
  {
    while (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r' || *p == ',')
      ++p;
    if (*p == '\0')
      break;

    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(p, &end);
    if (end == p || errno == ERANGE)
      throw ParseError(where, "invalid number in '" + text + "'");
    if (!std::isfinite(v))
      throw ParseError(where, "non-finite number in '" + text + "'");
    out.push_back(v);
    p = end;
  }

  if (expected != 0 && out.size() != expected)
    throw ParseError(where, "expected " + std::to_string(expected) + " numbers, got " + std::to_string(out.size()) +
                                " in '" + text + "'");
  return out;
}

const tinyxml2::XMLElement* reqChild(const tinyxml2::XMLElement* parent, const char* name, const std::string& file)
{
  const tinyxml2::XMLElement* c = parent->FirstChildElement(name);
  if (!c)
    throw ParseError(xml::where(parent, file),
                     std::string("<") + parent->Name() + "> is missing required child <" + name + ">");
  return c;
}

const char* reqAttribute(const tinyxml2::XMLElement* elem, const char* name, const std::string& file)
{
  const char* v = elem->Attribute(name);
  if (!v)
    throw ParseError(xml::where(elem, file),
                     std::string("<") + elem->Name() + "> is missing required attribute '" + name + "'");
  return v;
}

double reqNumberAttribute(const tinyxml2::XMLElement* elem, const char* name, const std::string& file)
{
  return parseNumberList(reqAttribute(elem, name, file), xml::where(elem, file), 1)[0];
}

double numberAttribute(const tinyxml2::XMLElement* elem, const char* name, double default_value,
                       const std::string& file)
{
  const char* v = elem->Attribute(name);
  if (!v)
    return default_value;
  return parseNumberList(v, xml::where(elem, file), 1)[0];
}

std::vector<double> numbersAttribute(const tinyxml2::XMLElement* elem, const char* name, std::size_t n,
                                     const std::vector<double>& default_value, const std::string& file)
{
  const char* v = elem->Attribute(name);
  if (!v)
    return default_value;
  return parseNumberList(v, xml::where(elem, file), n);
}

Eigen::Vector3d vector3Attribute(const tinyxml2::XMLElement* elem, const char* name,
                                 const Eigen::Vector3d& default_value, const std::string& file)
{
  const char* v = elem->Attribute(name);
  if (!v)
    return default_value;
  auto n = parseNumberList(v, xml::where(elem, file), 3);
  return Eigen::Vector3d(n[0], n[1], n[2]);
}

std::string childText(const tinyxml2::XMLElement* parent, const char* name)
{
  const tinyxml2::XMLElement* c = parent->FirstChildElement(name);
  if (!c || !c->GetText())
    return {};
  return trim(c->GetText());
}

double reqChildNumber(const tinyxml2::XMLElement* parent, const char* name, const std::string& file)
{
  const tinyxml2::XMLElement* c = reqChild(parent, name, file);
  return parseNumberList(c->GetText() ? c->GetText() : "", xml::where(c, file), 1)[0];
}

double childNumber(const tinyxml2::XMLElement* parent, const char* name, double default_value,
                   const std::string& file)
{
  const tinyxml2::XMLElement* c = parent->FirstChildElement(name);
  if (!c)
    return default_value;
  return parseNumberList(c->GetText() ? c->GetText() : "", xml::where(c, file), 1)[0];
}

}  // namespace xml
}  // namespace robodiff
