#pragma once
#include <string>

namespace robodiff {

enum class MeshReferenceMode
{
  FileName,  // compare only the file name of the reference
  FullPath,  // compare the whole normalized path
};

/**
 * Normalize a mesh reference so references authored by different formats compare equal.
 *
 * Supported inputs:
 *  - package://<pkg>/path/file.ext   (package name dropped)
 *  - model://<model>/path/file.ext   (model name dropped)
 *  - file:///abs/path, plain absolute or relative filesystem paths
 *  - usd:<prim path>                 (in-layer mesh prims, kept as is)
 *
 * Backslashes become forward slashes and the path is lexically normalized. With
 * MeshReferenceMode::FileName only the last path element is returned.
 */
std::string normalizeMeshReference(const std::string& uri, MeshReferenceMode mode);

// Join a relative reference onto a directory; absolute references and references with a scheme are returned as is.
std::string joinReference(const std::string& dir, const std::string& uri);

// Directory part of a file path ("" for a bare file name).
std::string getDirectory(const std::string& filepath);

// Whole file contents. Throws ParseError when the file cannot be read.
std::string readFile(const std::string& filename);

MeshReferenceMode meshReferenceModeFromString(const std::string& str);
std::string meshReferenceModeToString(MeshReferenceMode mode);

}  // namespace robodiff
