#include <robodiff/uri_resolver.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <robodiff/errors.h>

namespace {

bool has_scheme(const std::string& u)
{
  auto p = u.find("://");
  return p != std::string::npos && p > 0;
}

// drop "<scheme>://<authority>/" for schemes whose authority names a package, not a directory
std::string strip_package_scheme(const std::string& uri, const std::string& scheme)
{
  if (uri.rfind(scheme, 0) != 0)
    return uri;
  std::string rest = uri.substr(scheme.size());
  auto slash = rest.find('/');
  return slash == std::string::npos ? std::string() : rest.substr(slash + 1);
}

}  // namespace

namespace robodiff {

std::string normalizeMeshReference(const std::string& uri, MeshReferenceMode mode)
{
  if (uri.rfind("usd:", 0) == 0)
    return uri;

  std::string s = uri;
  std::replace(s.begin(), s.end(), '\\', '/');

  s = strip_package_scheme(s, "package://");
  s = strip_package_scheme(s, "model://");
  if (s.rfind("file://", 0) == 0)
    s = s.substr(7);

  std::filesystem::path p = std::filesystem::path(s).lexically_normal();
  if (mode == MeshReferenceMode::FileName)
    return p.filename().generic_string();
  return p.generic_string();
}

std::string joinReference(const std::string& dir, const std::string& uri)
{
  if (dir.empty() || uri.empty() || has_scheme(uri) || uri[0] == '/')
    return uri;
  return (std::filesystem::path(dir) / uri).lexically_normal().generic_string();
}

std::string getDirectory(const std::string& filepath)
{
  return std::filesystem::path(filepath).parent_path().string();
}

std::string readFile(const std::string& filename)
{
  std::ifstream in(filename, std::ios::binary);
  if (!in)
    throw ParseError(filename, "cannot open file");
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

MeshReferenceMode meshReferenceModeFromString(const std::string& str)
{
  if (str == "file_name")
    return MeshReferenceMode::FileName;
  if (str == "full_path")
    return MeshReferenceMode::FullPath;
  throw std::runtime_error("Unknown MeshReferenceMode: " + str);
}

std::string meshReferenceModeToString(MeshReferenceMode mode)
{
  return mode == MeshReferenceMode::FileName ? "file_name" : "full_path";
}

}  // namespace robodiff
