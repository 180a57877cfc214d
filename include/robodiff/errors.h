#ifndef ROBODIFF_ERRORS_H_
#define ROBODIFF_ERRORS_H_

#include <stdexcept>
#include <string>

namespace robodiff {

/**
 * @brief Malformed source or violated structural invariant. Fatal for the file being parsed.
 */
class ParseError : public std::runtime_error
{
public:
  ParseError(const std::string& location, const std::string& reason);

  const std::string& location() const
  {
    return location_;
  }
  const std::string& reason() const
  {
    return reason_;
  }

private:
  std::string location_;
  std::string reason_;
};

/**
 * @brief In-scope element using a sub-variant that is not modelled (e.g. an ellipsoid collision).
 *
 * Adapters catch it and record a warning on the model; parsing continues.
 */
class UnsupportedElementError : public std::runtime_error
{
public:
  UnsupportedElementError(const std::string& location, const std::string& element);

  const std::string& location() const
  {
    return location_;
  }
  const std::string& element() const
  {
    return element_;
  }

private:
  std::string location_;
  std::string element_;
};

// No adapter could be selected for an input file.
class FormatDetectionError : public std::runtime_error
{
public:
  explicit FormatDetectionError(const std::string& what) : std::runtime_error(what)
  {
  }
};

// Requested field category is unknown or can never be populated by the selected adapters.
class ComparisonScopeError : public std::runtime_error
{
public:
  explicit ComparisonScopeError(const std::string& what) : std::runtime_error(what)
  {
  }
};

}  // namespace robodiff

#endif  // ROBODIFF_ERRORS_H_
