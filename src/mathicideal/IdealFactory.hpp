// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_IDEAL_FACTORY_GUARD
#define MATHICIDEAL_IDEAL_FACTORY_GUARD

#include "Ideal.hpp"
#include <string>
#include <vector>

MATHICIDEAL_NAMESPACE_BEGIN

class Ring;

/// What an ideal is to be made from. The shape of the input is resolved
/// when the request is made, so that makeIdeal can look at the shape first
/// and only then do anything that depends on the ring.
class IdealRequest {
public:
  enum Shape {
    RingAndGens, /// a ring and generators to coerce into it
    ElementList, /// elements whose common parent ring is the ring
    SingleElement, /// the principal ideal of an element in its parent ring
    FromIdeal, /// an existing ideal, classified again
    Invalid /// something that no ideal can be made from
  };

  static IdealRequest ringAndGens
    (const Ring& ring, std::vector<Element> gens, bool coerce);

  /// Invalid if elements is empty or if an element has no parent ring.
  static IdealRequest elementList(std::vector<Element> elements);

  /// Invalid if element has no parent ring.
  static IdealRequest singleElement(const Element& element);

  static IdealRequest fromIdeal(const Ideal& ideal);

  Shape shape() const {return mShape;}

  /// The ring for RingAndGens and FromIdeal, otherwise null.
  const Ring* ring() const {return mRing;}

  const std::vector<Element>& gens() const {return mGens;}
  bool coerce() const {return mCoerce;}

  /// Why the request is Invalid.
  const std::string& invalidReason() const {return mInvalidReason;}

private:
  IdealRequest(Shape shape, const Ring* ring, std::vector<Element> gens);
  static IdealRequest invalid(std::string reason);

  Shape mShape;
  const Ring* mRing;
  std::vector<Element> mGens;
  bool mCoerce;
  std::string mInvalidReason;
};

/// Makes the ideal that the request describes:
///  1. FromIdeal: the ring and generators of the ideal are used.
///  2. ElementList: the ring is the common parent ring of the elements.
///     Throws TypeError if there is none.
///  3. SingleElement: the ring is the parent ring of the element.
///  4. Throws TypeError if the ring is not commutative.
///  5. The generators are normalized - see normalizeGenerators.
///  6. In a principal ideal domain the generators are replaced by their gcd
///     and the ideal is a Pid ideal.
///  7. Otherwise one generator makes a Principal ideal.
///  8. Otherwise the ideal is Generic.
/// An Invalid request throws TypeError.
Ideal makeIdeal(const IdealRequest& request);

Ideal makeIdeal(
  const Ring& ring,
  std::vector<Element> gens,
  bool coerce = true
);

/// The principal ideal of element in ring.
Ideal makeIdeal(const Ring& ring, const Element& element);

/// The ideal of ring generated by the generators of ideal.
Ideal makeIdeal(const Ring& ring, const Ideal& ideal);

Ideal makeIdeal(const Ideal& ideal);
Ideal makeIdeal(std::vector<Element> elements);
Ideal makeIdeal(const Element& element);

/// Makes a Fractional ideal of the normalized generators. There is no
/// classification.
Ideal makeFractionalIdeal(
  const Ring& ring,
  std::vector<Element> gens,
  bool coerce = true
);

MATHICIDEAL_NAMESPACE_END

#endif
