// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "GeneratorNormalizer.hpp"

#include "Ring.hpp"
#include "Errors.hpp"
#include <set>

MATHICIDEAL_NAMESPACE_BEGIN

namespace {
  class ElementLess {
  public:
    ElementLess(const Ring& ring): mRing(&ring) {}

    bool operator()(const Element& a, const Element& b) const {
      return mRing->compare(a, b) == LessThan;
    }

  private:
    const Ring* mRing;
  };
}

std::vector<Element> normalizeGenerators(
  const Ring& ring,
  std::vector<Element> gens,
  bool coerce
) {
  if (gens.empty()) {
    gens.push_back(ring.zero());
    return gens;
  }

  for (auto it = gens.begin(); it != gens.end(); ++it) {
    if (coerce)
      *it = ring.coerce(*it);
    else if (!it->hasRing() || &it->ring() != &ring)
      throw TypeError
        (it->toString() + " is not an element of " + ring.name() + '.');
  }

  std::set<Element, ElementLess> seen((ElementLess(ring)));
  std::vector<Element> unique;
  unique.reserve(gens.size());
  for (auto it = gens.begin(); it != gens.end(); ++it)
    if (seen.insert(*it).second)
      unique.push_back(std::move(*it));
  return unique;
}

std::vector<Element> normalizeGenerators(
  const Ring& ring,
  const Element& gen,
  bool coerce
) {
  return normalizeGenerators(ring, std::vector<Element>(1, gen), coerce);
}

MATHICIDEAL_NAMESPACE_END
