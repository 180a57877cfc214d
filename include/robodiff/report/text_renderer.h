#ifndef ROBODIFF_REPORT_TEXT_RENDERER_H_
#define ROBODIFF_REPORT_TEXT_RENDERER_H_

#include <string>

#include <robodiff/diff/diff_report.h>

namespace robodiff {
namespace report {

enum class Layout
{
  Status,  // summary, then REMOVED / ADDED / MODIFIED sections
  Git,     // "-" / "+" lines per changed field
};

struct RenderOptions
{
  Layout layout = Layout::Status;
  bool color = false;  // ANSI red/green
  bool warnings = true;
};

std::string renderReport(const diff::DiffReport& report, const RenderOptions& options = RenderOptions());

// One "[A|B] <location>: <message>" line per warning.
std::string renderWarnings(const diff::DiffReport& report);

Layout layoutFromString(const std::string& str);
std::string layoutToString(Layout layout);

}  // namespace report
}  // namespace robodiff

#endif  // ROBODIFF_REPORT_TEXT_RENDERER_H_
