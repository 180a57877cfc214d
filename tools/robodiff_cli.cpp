#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include <robodiff/compare.h>
#include <robodiff/errors.h>
#include <robodiff/report/text_renderer.h>

namespace {

constexpr int kExitEquivalent = 0;
constexpr int kExitDifferent = 1;
constexpr int kExitFailure = 2;

void printUsage(std::ostream& os)
{
  os << "Usage: robodiff_cli <model_a> <model_b> [options]\n"
        "\n"
        "Semantic diff of two robot models (URDF .urdf, SDFormat .sdf, MJCF .xml, USD .usda).\n"
        "\n"
        "Options:\n"
        "  --format-a FORMAT      format of model_a (urdf, sdf, mjcf, usd)\n"
        "  --format-b FORMAT      format of model_b\n"
        "  --tol-linear X         linear tolerance (default 1e-6)\n"
        "  --tol-angular X        angular tolerance in radians (default 1e-6)\n"
        "  --relative             scale the linear tolerance by the compared magnitudes\n"
        "  --include-visual       compare visual geometry too\n"
        "  --fields LIST          comma separated subset of kinematics,inertial,collision,visual\n"
        "  --mesh-ref MODE        file_name (default) or full_path\n"
        "  --layout LAYOUT        status (default) or git\n"
        "  --color                colorize the report\n"
        "\n"
        "Exit status: 0 models equivalent, 1 differences found, 2 comparison failed.\n";
}

double parseTolerance(const std::string& option, const std::string& value)
{
  std::size_t pos = 0;
  const double x = std::stod(value, &pos);
  if (pos != value.size() || x < 0.0)
    throw std::invalid_argument("invalid value '" + value + "' for " + option);
  return x;
}

}  // namespace

int main(int argc, char** argv)
{
  robodiff::CompareOptions options;
  robodiff::report::RenderOptions render;
  render.warnings = false;
  render.color = isatty(STDOUT_FILENO);
  std::string files[2];
  int nfiles = 0;

  try
  {
    for (int i = 1; i < argc; ++i)
    {
      const std::string arg = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc)
          throw std::invalid_argument("missing value for " + arg);
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help")
      {
        printUsage(std::cout);
        return kExitEquivalent;
      }
      else if (arg == "--format-a")
        options.format_a = robodiff::model::modelFormatFromString(value());
      else if (arg == "--format-b")
        options.format_b = robodiff::model::modelFormatFromString(value());
      else if (arg == "--tol-linear")
        options.diff.tolerance_linear = parseTolerance(arg, value());
      else if (arg == "--tol-angular")
        options.diff.tolerance_angular = parseTolerance(arg, value());
      else if (arg == "--relative")
        options.diff.tolerance_mode = robodiff::diff::ToleranceMode::Relative;
      else if (arg == "--include-visual")
        options.diff.include_visual = true;
      else if (arg == "--fields")
        options.diff.fields = robodiff::parseFieldList(value());
      else if (arg == "--mesh-ref")
        options.diff.mesh_reference_mode = robodiff::meshReferenceModeFromString(value());
      else if (arg == "--layout")
        render.layout = robodiff::report::layoutFromString(value());
      else if (arg == "--color")
        render.color = true;
      else if (!arg.empty() && arg[0] == '-')
        throw std::invalid_argument("unknown option " + arg);
      else if (nfiles < 2)
        files[nfiles++] = arg;
      else
        throw std::invalid_argument("unexpected argument " + arg);
    }
    if (nfiles != 2)
      throw std::invalid_argument("two model files are required");
  }
  catch (const robodiff::ComparisonScopeError& e)
  {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return kExitFailure;
  }
  catch (const std::exception& e)
  {
    std::cerr << "ERROR: " << e.what() << "\n\n";
    printUsage(std::cerr);
    return kExitFailure;
  }

  const robodiff::CompareOutcome outcome = robodiff::compare(files[0], files[1], options);
  if (outcome.status == robodiff::CompareStatus::Failed)
  {
    std::cerr << "ERROR: " << outcome.error << std::endl;
    return kExitFailure;
  }

  for (const auto& w : outcome.report->warnings)
    std::cerr << "WARNING: [" << robodiff::diff::modelSideToString(w.side) << "] " << w.warning.location.toString()
              << ": " << w.warning.message << std::endl;

  std::cout << robodiff::report::renderReport(*outcome.report, render);
  return outcome.status == robodiff::CompareStatus::Equivalent ? kExitEquivalent : kExitDifferent;
}
