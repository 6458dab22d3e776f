// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_ELEMENT_GUARD
#define MATHICIDEAL_ELEMENT_GUARD

#include "Poly.hpp"
#include <ostream>
#include <string>
#include <utility>

MATHICIDEAL_NAMESPACE_BEGIN

class Ring;

/// An element of a ring. An Element is an immutable value that refers to its
/// parent ring, so the ring must outlive every element of it. The arithmetic
/// is done by the ring - Element only forwards to it.
///
/// A default-constructed Element has no parent ring. Such an element is not
/// a value of any ring and most operations on it are an error - it exists so
/// that containers of elements can be resized and so that callers have a way
/// to say "no value".
class Element {
public:
  Element(): mRing(nullptr) {}

  /// Only rings should call this constructor. poly must already be in the
  /// canonical form of ring.
  Element(const Ring& ring, Poly poly): mRing(&ring), mPoly(std::move(poly)) {}

  bool hasRing() const {return mRing != nullptr;}

  const Ring& ring() const {
    MATHICIDEAL_ASSERT(hasRing());
    return *mRing;
  }

  const Poly& poly() const {return mPoly;}

  bool isZero() const;
  bool isUnit() const;

  /// Returns true if this element divides x.
  bool divides(const Element& x) const;

  Element gcd(const Element& x) const;

  /// Returns (q, r) with *this == q * divisor + r.
  std::pair<Element, Element> quoRem(const Element& divisor) const;

  Element pow(unsigned long exponent) const;

  /// A total order on the elements of a ring. It is deterministic but it
  /// means nothing mathematically.
  CompareResult compare(const Element& x) const;

  std::string toString() const;

private:
  const Ring* mRing;
  Poly mPoly;
};

Element operator+(const Element& a, const Element& b);
Element operator-(const Element& a, const Element& b);
Element operator*(const Element& a, const Element& b);
Element operator-(const Element& a);

/// Elements of different rings are equal if they are equal after coercing
/// one into the ring of the other. If neither ring can absorb the other then
/// the elements are not equal.
bool operator==(const Element& a, const Element& b);
inline bool operator!=(const Element& a, const Element& b) {return !(a == b);}

std::ostream& operator<<(std::ostream& out, const Element& e);

/// Returns the ring that both a and b can be coerced into - the ring of a is
/// preferred. Throws CoercionError if there is no such ring.
const Ring& commonRing(const Element& a, const Element& b);

MATHICIDEAL_NAMESPACE_END

#endif
