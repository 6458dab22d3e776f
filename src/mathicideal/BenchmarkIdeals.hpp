// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_BENCHMARK_IDEALS_GUARD
#define MATHICIDEAL_BENCHMARK_IDEALS_GUARD

#include "Ideal.hpp"
#include <string>
#include <vector>

MATHICIDEAL_NAMESPACE_BEGIN

class Ring;

/// Computes the generators of well-known benchmark ideals.
class IdealBackend {
public:
  virtual ~IdealBackend() {}

  /// Returns the generators of the construction called name in the first
  /// varCount variables of ring, homogenized if homogeneous is true.
  /// Throws DomainError for an unknown name.
  virtual std::vector<Element> evaluateNamedConstruction(
    const Ring& ring,
    const std::string& name,
    VarIndex varCount,
    bool homogeneous
  ) = 0;
};

/// Computes "cyclic" and "katsura" through the Ring interface, so it works
/// for any ring with enough variables.
class PolyBackend : public IdealBackend {
public:
  virtual std::vector<Element> evaluateNamedConstruction(
    const Ring& ring,
    const std::string& name,
    VarIndex varCount,
    bool homogeneous
  );

  /// The cyclic n-roots system in the first n variables of ring.
  static std::vector<Element> cyclic(const Ring& ring, VarIndex n);

  /// The Katsura system in the first n variables of ring.
  static std::vector<Element> katsura(const Ring& ring, VarIndex n);

  /// Multiplies each term of f by the power of the variable var that makes
  /// the term have the degree of f.
  static Element homogenize(const Element& f, VarIndex var);
};

/// The ideal of the cyclic n-roots system in the first n variables of ring.
/// n == 0 means all the variables. Throws DomainError if ring has no
/// variables or fewer than n.
Ideal cyclicIdeal(
  const Ring& ring,
  IdealBackend& backend,
  VarIndex n = 0,
  bool homogeneous = false
);

/// As cyclicIdeal for the Katsura system.
Ideal katsuraIdeal(
  const Ring& ring,
  IdealBackend& backend,
  VarIndex n = 0,
  bool homogeneous = false
);

/// The ideal generated by x^q - x for each variable x of ring, where q is
/// the order of the base ring. Throws DomainError if the base ring is
/// infinite or if q is too large to be an exponent.
Ideal fieldIdeal(const Ring& ring);

MATHICIDEAL_NAMESPACE_END

#endif
