// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Element.hpp"

#include "Ring.hpp"
#include "Errors.hpp"

MATHICIDEAL_NAMESPACE_BEGIN

namespace {
  void checkHasRing(const Element& e) {
    if (!e.hasRing())
      throw TypeError("element has no parent ring");
  }

  /// Calls op(ring, a', b') where a' and b' are a and b coerced into their
  /// common ring.
  template<class Op>
  auto inCommonRing(const Element& a, const Element& b, Op op)
    -> decltype(op(a.ring(), a, b))
  {
    const auto& ring = commonRing(a, b);
    if (&ring == &a.ring() && &ring == &b.ring())
      return op(ring, a, b);
    return op(ring, ring.coerce(a), ring.coerce(b));
  }
}

const Ring& commonRing(const Element& a, const Element& b) {
  checkHasRing(a);
  checkHasRing(b);
  if (&a.ring() == &b.ring() || a.ring().canCoerceFrom(b.ring()))
    return a.ring();
  if (b.ring().canCoerceFrom(a.ring()))
    return b.ring();
  throw CoercionError("no common ring for " + a.toString() + " in " +
    a.ring().name() + " and " + b.toString() + " in " + b.ring().name());
}

bool Element::isZero() const {
  checkHasRing(*this);
  return ring().isZero(*this);
}

bool Element::isUnit() const {
  checkHasRing(*this);
  return ring().isUnit(*this);
}

bool Element::divides(const Element& x) const {
  return inCommonRing(*this, x,
    [](const Ring& r, const Element& a, const Element& b) {
      return r.divides(a, b);
    });
}

Element Element::gcd(const Element& x) const {
  return inCommonRing(*this, x,
    [](const Ring& r, const Element& a, const Element& b) {
      return r.gcd(a, b);
    });
}

std::pair<Element, Element> Element::quoRem(const Element& divisor) const {
  return inCommonRing(*this, divisor,
    [](const Ring& r, const Element& a, const Element& b) {
      std::pair<Element, Element> qr;
      r.quoRem(a, b, qr.first, qr.second);
      return qr;
    });
}

Element Element::pow(unsigned long exponent) const {
  checkHasRing(*this);
  auto result = ring().one();
  auto square = *this;
  while (exponent != 0) {
    if (exponent & 1)
      result = ring().multiply(result, square);
    exponent >>= 1;
    if (exponent != 0)
      square = ring().multiply(square, square);
  }
  return result;
}

CompareResult Element::compare(const Element& x) const {
  return inCommonRing(*this, x,
    [](const Ring& r, const Element& a, const Element& b) {
      return r.compare(a, b);
    });
}

std::string Element::toString() const {
  if (!hasRing())
    return "<no ring>";
  return ring().toString(*this);
}

Element operator+(const Element& a, const Element& b) {
  return inCommonRing(a, b,
    [](const Ring& r, const Element& x, const Element& y) {
      return r.add(x, y);
    });
}

Element operator-(const Element& a, const Element& b) {
  return inCommonRing(a, b,
    [](const Ring& r, const Element& x, const Element& y) {
      return r.subtract(x, y);
    });
}

Element operator*(const Element& a, const Element& b) {
  return inCommonRing(a, b,
    [](const Ring& r, const Element& x, const Element& y) {
      return r.multiply(x, y);
    });
}

Element operator-(const Element& a) {
  checkHasRing(a);
  return a.ring().negate(a);
}

bool operator==(const Element& a, const Element& b) {
  if (!a.hasRing() || !b.hasRing())
    return a.hasRing() == b.hasRing();
  if (&a.ring() == &b.ring())
    return a.ring().equal(a, b);
  try {
    return inCommonRing(a, b,
      [](const Ring& r, const Element& x, const Element& y) {
        return r.equal(x, y);
      });
  } catch (const CoercionError&) {
    return false;
  }
}

std::ostream& operator<<(std::ostream& out, const Element& e) {
  return out << e.toString();
}

MATHICIDEAL_NAMESPACE_END
