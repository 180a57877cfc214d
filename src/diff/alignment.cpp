#include <robodiff/diff/alignment.h>

#include <map>

namespace robodiff {
namespace diff {

namespace {

template <typename T>
void matchByName(const std::vector<T>& a, const std::vector<T>& b, std::vector<MatchedPair<T>>& matched,
                 std::vector<const T*>& only_a, std::vector<const T*>& only_b)
{
  std::map<std::string, const T*> by_name;
  for (const auto& e : b)
    by_name.emplace(e.name, &e);

  for (const auto& e : a)
  {
    auto it = by_name.find(e.name);
    if (it == by_name.end())
    {
      only_a.push_back(&e);
      continue;
    }
    matched.emplace_back(&e, it->second);
    by_name.erase(it);
  }

  for (const auto& e : b)
  {
    if (by_name.count(e.name))
      only_b.push_back(&e);
  }
}

}  // namespace

Alignment alignModels(const model::CanonicalModel& a, const model::CanonicalModel& b)
{
  Alignment alignment;
  matchByName(a.links, b.links, alignment.links, alignment.links_only_in_a, alignment.links_only_in_b);

  std::vector<MatchedPair<model::Joint>> joints;
  matchByName(a.joints, b.joints, joints, alignment.joints_only_in_a, alignment.joints_only_in_b);

  for (const auto& pair : joints)
  {
    if (pair.first->parent_link != pair.second->parent_link || pair.first->child_link != pair.second->child_link)
      alignment.structure_mismatches.push_back(pair);
    else
      alignment.joints.push_back(pair);
  }
  return alignment;
}

}  // namespace diff
}  // namespace robodiff
