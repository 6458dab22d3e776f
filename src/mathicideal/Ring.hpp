// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_RING_GUARD
#define MATHICIDEAL_RING_GUARD

#include "Element.hpp"
#include <gmpxx.h>
#include <string>
#include <vector>

MATHICIDEAL_NAMESPACE_BEGIN

/// The interface through which ideals see their ring. An ideal never owns its
/// ring and never changes it. Rings are not copyable since elements and
/// ideals refer to them by address.
///
/// The element operations all take elements of this ring. Use coerce() first
/// for anything else.
class Ring {
public:
  Ring() {}
  virtual ~Ring() {}

  /// Human readable name such as "Integer Ring".
  virtual std::string name() const = 0;

  // *** Capabilities

  virtual bool isCommutative() const = 0;
  virtual bool isPrincipalIdealDomain() const = 0;
  virtual bool isField() const = 0;

  /// Returns true if the base coefficient ring is finite, in which case its
  /// number of elements is stored in order. Returns false for an infinite
  /// base ring and then order is left alone.
  virtual bool baseRingOrder(mpz_class& order) const = 0;

  // *** Generators of the ring as an algebra over its base

  virtual VarIndex varCount() const = 0;
  virtual std::string variableName(VarIndex var) const = 0;

  /// Returns the index of the variable with the given name, or varCount()
  /// if there is no such variable.
  virtual VarIndex variableIndex(const std::string& name) const = 0;

  virtual Element gen(VarIndex var) const = 0;
  std::vector<Element> gens() const;

  // *** Making elements

  virtual Element fromInteger(const mpz_class& value) const = 0;

  /// Throws CoercionError if value is not in the ring, for example 1/2 in
  /// the integers.
  virtual Element fromRational(const mpq_class& value) const = 0;

  /// Puts poly into canonical form - sorted terms, combined like terms,
  /// canonical coefficients - and makes it an element. poly must have
  /// varCount() variables.
  virtual Element makeElement(Poly poly) const = 0;

  Element zero() const {return fromInteger(0);}
  Element one() const {return fromInteger(1);}

  // *** Coercion

  /// Returns true if every element of ring has an image in this ring.
  /// Every ring can coerce from itself.
  virtual bool canCoerceFrom(const Ring& ring) const = 0;

  /// Maps x into this ring, throwing CoercionError if x has no image here.
  /// This is a conversion of the value, so it can succeed even when
  /// canCoerceFrom(x.ring()) is false - the rational 2 is also an integer.
  virtual Element coerce(const Element& x) const = 0;

  // *** Element operations

  virtual bool isZero(const Element& a) const = 0;
  virtual bool isUnit(const Element& a) const = 0;
  virtual bool equal(const Element& a, const Element& b) const = 0;
  virtual CompareResult compare(const Element& a, const Element& b) const = 0;

  virtual Element add(const Element& a, const Element& b) const = 0;
  virtual Element subtract(const Element& a, const Element& b) const = 0;
  virtual Element negate(const Element& a) const = 0;
  virtual Element multiply(const Element& a, const Element& b) const = 0;

  /// Returns true if a divides b.
  virtual bool divides(const Element& a, const Element& b) const = 0;

  /// Throws NotImplementedCapability if the ring has no gcd algorithm.
  virtual Element gcd(const Element& a, const Element& b) const = 0;

  /// Sets quotient and remainder so that a == quotient * b + remainder.
  /// Throws NotImplementedCapability if the ring has no division algorithm
  /// and DomainError if b is zero.
  virtual void quoRem(
    const Element& a,
    const Element& b,
    Element& quotient,
    Element& remainder
  ) const = 0;

  virtual std::string toString(const Element& a) const = 0;

private:
  Ring(const Ring&); // unavailable
  void operator=(const Ring&); // unavailable
};

inline std::ostream& operator<<(std::ostream& out, const Ring& ring) {
  return out << ring.name();
}

/// Returns the first ring among the parents of elems that every other parent
/// can be coerced into. Returns null if there is no such ring, if elems is
/// empty or if some element has no parent.
const Ring* commonParent(const std::vector<Element>& elems);

MATHICIDEAL_NAMESPACE_END

#endif
