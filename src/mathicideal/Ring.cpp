// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Ring.hpp"

#include <algorithm>

MATHICIDEAL_NAMESPACE_BEGIN

std::vector<Element> Ring::gens() const {
  std::vector<Element> gens;
  gens.reserve(varCount());
  for (VarIndex var = 0; var < varCount(); ++var)
    gens.push_back(gen(var));
  return gens;
}

const Ring* commonParent(const std::vector<Element>& elems) {
  for (const auto& candidate : elems) {
    if (!candidate.hasRing())
      return nullptr;
    const auto& ring = candidate.ring();
    const auto absorbs = [&](const Element& e) {
      return e.hasRing() && ring.canCoerceFrom(e.ring());
    };
    if (std::all_of(elems.begin(), elems.end(), absorbs))
      return &ring;
  }
  return nullptr;
}

MATHICIDEAL_NAMESPACE_END
