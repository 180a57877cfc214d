#ifndef ROBODIFF_DIFF_ALIGNMENT_H_
#define ROBODIFF_DIFF_ALIGNMENT_H_

#include <string>
#include <utility>
#include <vector>

#include <robodiff/model/canonical_model.h>

namespace robodiff {
namespace diff {

template <typename T>
using MatchedPair = std::pair<const T*, const T*>;

/**
 * @brief Name-based correspondence between the entities of two models.
 *
 * Pointers refer into the aligned models, which must outlive the alignment.
 */
struct Alignment
{
  std::vector<MatchedPair<model::Link>> links;
  std::vector<MatchedPair<model::Joint>> joints;

  std::vector<const model::Link*> links_only_in_a;
  std::vector<const model::Link*> links_only_in_b;
  std::vector<const model::Joint*> joints_only_in_a;
  std::vector<const model::Joint*> joints_only_in_b;

  // Same name on both sides but a different parent/child link pair.
  std::vector<MatchedPair<model::Joint>> structure_mismatches;
};

// Exact name matching within each entity kind; no renames, no fuzzy fallback.
Alignment alignModels(const model::CanonicalModel& a, const model::CanonicalModel& b);

}  // namespace diff
}  // namespace robodiff

#endif  // ROBODIFF_DIFF_ALIGNMENT_H_
