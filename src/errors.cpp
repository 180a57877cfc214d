#include <robodiff/errors.h>

namespace robodiff {

ParseError::ParseError(const std::string& location, const std::string& reason)
  : std::runtime_error(location.empty() ? reason : location + ": " + reason), location_(location), reason_(reason)
{
}

UnsupportedElementError::UnsupportedElementError(const std::string& location, const std::string& element)
  : std::runtime_error((location.empty() ? std::string() : location + ": ") + "unsupported element '" + element + "'")
  , location_(location)
  , element_(element)
{
}

}  // namespace robodiff
