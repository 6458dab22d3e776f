// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_GENERATOR_NORMALIZER_GUARD
#define MATHICIDEAL_GENERATOR_NORMALIZER_GUARD

#include "Element.hpp"
#include <vector>

MATHICIDEAL_NAMESPACE_BEGIN

class Ring;

/// Turns a list of candidate generators into the generator list of an ideal
/// of ring:
///  - an empty list becomes the single generator zero,
///  - if coerce is true every generator is coerced into ring, and otherwise
///    every generator must already be an element of ring,
///  - duplicates are removed, keeping the first occurrence of each element.
///
/// Throws CoercionError if a generator cannot be coerced and TypeError if
/// coerce is false and a generator is not an element of ring. No list is
/// returned in either case.
std::vector<Element> normalizeGenerators(
  const Ring& ring,
  std::vector<Element> gens,
  bool coerce
);

/// As above for a single generator.
std::vector<Element> normalizeGenerators(
  const Ring& ring,
  const Element& gen,
  bool coerce
);

MATHICIDEAL_NAMESPACE_END

#endif
