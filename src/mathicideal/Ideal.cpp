// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Ideal.hpp"

#include "IdealFactory.hpp"
#include "Ring.hpp"
#include "Errors.hpp"
#include "LogDomain.hpp"
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <algorithm>
#include <sstream>
#include <string>

MATHICIDEAL_NAMESPACE_BEGIN

MATHICIDEAL_DEFINE_LOG_DOMAIN(
  IdealArithmetic,
  "Displays the sums, products and reductions of ideals."
);

MATHICIDEAL_DEFINE_LOG_DOMAIN_WITH_DEFAULTS(
  IdealProduct,
  "Measures the time spent multiplying generators of ideals.",
  0, 0, 1
);

namespace {
  /// Products with at least this many pairs of generators are computed in
  /// parallel.
  const size_t ParallelProductThreshold = 64;

  /// Returns true if every element of a equals some element of b.
  bool isSubset(const std::vector<Element>& a, const std::vector<Element>& b) {
    for (auto ai = a.begin(); ai != a.end(); ++ai) {
      auto bi = b.begin();
      while (bi != b.end() && *ai != *bi)
        ++bi;
      if (bi == b.end())
        return false;
    }
    return true;
  }

  bool isPrincipalKind(Ideal::Kind kind) {
    switch (kind) {
    case Ideal::Generic:
    case Ideal::Fractional:
      return false;
    case Ideal::Principal:
    case Ideal::Pid:
      return true;
    }
    MATHICIDEAL_UNREACHABLE;
  }

  bool haveCommonRing(const Ring& a, const Ring& b) {
    return &a == &b || a.canCoerceFrom(b) || b.canCoerceFrom(a);
  }
}

const char* kindName(Ideal::Kind kind) {
  switch (kind) {
  case Ideal::Generic: return "Generic";
  case Ideal::Principal: return "Principal";
  case Ideal::Pid: return "Pid";
  case Ideal::Fractional: return "Fractional";
  }
  MATHICIDEAL_UNREACHABLE;
}

Ideal::Ideal(const Ring& ring, Kind kind, std::vector<Element> gens):
  mRing(&ring),
  mKind(kind),
  mGens(std::move(gens))
{
  MATHICIDEAL_ASSERT(!mGens.empty());
  MATHICIDEAL_ASSERT(!isPrincipalKind(kind) || mGens.size() == 1);
}

const Element& Ideal::gen() const {
  if (genCount() != 1)
    throw NotImplementedCapability
      (toString() + " has more than one generator.");
  return mGens.front();
}

bool Ideal::isZero() const {
  return genCount() == 1 && mGens.front().isZero();
}

std::string Ideal::category() const {
  return "Category of ring ideals in " + ring().name();
}

Decision Ideal::contains(const Element& x) const {
  Element y;
  try {
    y = ring().coerce(x);
  } catch (const CoercionError&) {
    return Decision::no();
  }

  switch (mKind) {
  case Generic:
  case Fractional:
    if (isZero())
      return Decision::from(y.isZero());
    if (y.isZero())
      return Decision::yes();
    return Decision::unknown("Membership in a " +
      std::string(kindName(mKind)) + " ideal is not implemented.");

  case Principal:
  case Pid:
    if (gen().isZero())
      return Decision::from(y.isZero());
    return Decision::from(gen().divides(y));
  }
  MATHICIDEAL_UNREACHABLE;
}

Decision Ideal::isPrincipal() const {
  if (genCount() <= 1)
    return Decision::yes();
  return Decision::unknown("Deciding whether an ideal with " +
    std::to_string(genCount()) + " generators is principal is not "
    "implemented.");
}

Decision Ideal::isTrivial() const {
  if (isZero())
    return Decision::yes();
  if (isPrincipal().isTrue())
    return Decision::from(gen().isUnit());
  return Decision::unknown("Deciding whether a non-principal ideal is the "
    "unit ideal is not implemented.");
}

Decision Ideal::isPrime() const {
  return Decision::unknown("Primality testing of ideals is not implemented.");
}

Decision Ideal::isMaximal() const {
  return Decision::unknown
    ("Maximality testing of ideals is not implemented.");
}

bool Ideal::divides(const Ideal& other) const {
  if (!isPrincipalKind(mKind))
    throw NotImplementedCapability
      ("Divisibility is not implemented for " + toString() + '.');
  if (!other.isPrincipal().isTrue())
    throw NotImplementedCapability
      ("Divisibility is only implemented for principal ideals, not for " +
        other.toString() + '.');
  return gen().divides(other.gen());
}

Element Ideal::reduce(const Element& f) const {
  switch (mKind) {
  case Generic:
  case Principal:
  case Fractional:
    return f;

  case Pid: {
    const auto g = ring().coerce(f);
    if (gen().isZero())
      return g;
    Element quotient;
    Element remainder;
    ring().quoRem(g, gen(), quotient, remainder);
    MATHICIDEAL_LOG_INCREMENT(IdealArithmetic);
    MATHICIDEAL_LOG(IdealArithmetic) << "Reduced " << g << " modulo "
      << gen() << " to " << remainder << ".\n";
    return remainder;
  }
  }
  MATHICIDEAL_UNREACHABLE;
}

Ideal Ideal::sum(const Ideal& other) const {
  MATHICIDEAL_LOG_INCREMENT(IdealArithmetic);
  switch (mKind) {
  case Generic:
  case Principal:
  case Fractional: {
    auto gens = mGens;
    gens.insert(gens.end(), other.gens().begin(), other.gens().end());
    return makeIdeal(ring(), std::move(gens));
  }

  case Pid: {
    if (other.isPrincipal().isTrue()) {
      const auto g = ring().gcd(gen(), ring().coerce(other.gen()));
      MATHICIDEAL_LOG(IdealArithmetic) << "Sum of principal ideals is the "
        "gcd " << g << ".\n";
      return makeIdeal(ring(), g);
    }
    if (other.contains(gen()).isTrue())
      return other;
    throw NotImplementedCapability("The sum of " + toString() + " and " +
      other.toString() + " is not implemented.");
  }
  }
  MATHICIDEAL_UNREACHABLE;
}

Ideal Ideal::sum(const Element& x) const {
  return sum(makeIdeal(ring(), x));
}

Ideal Ideal::product(const Ideal& other) const {
  MATHICIDEAL_LOG_INCREMENT(IdealArithmetic);
  std::vector<Element> otherGens;
  otherGens.reserve(other.genCount());
  for (auto it = other.gens().begin(); it != other.gens().end(); ++it)
    otherGens.push_back(ring().coerce(*it));

  const auto otherCount = otherGens.size();
  const auto pairCount = genCount() * otherCount;
  std::vector<Element> products(pairCount);
  {
    MATHICIDEAL_LOG_TIME(IdealProduct) << "Multiplying " << pairCount
      << " pairs of generators.\n";
    const auto multiplyRange = [&](const tbb::blocked_range<size_t>& range) {
      for (auto i = range.begin(); i != range.end(); ++i) {
        const auto& a = mGens[i / otherCount];
        const auto& b = otherGens[i % otherCount];
        products[i] = ring().multiply(a, b);
      }
    };
    if (pairCount < ParallelProductThreshold)
      multiplyRange(tbb::blocked_range<size_t>(0, pairCount));
    else
      tbb::parallel_for
        (tbb::blocked_range<size_t>(0, pairCount), multiplyRange);
  }
  return makeIdeal(ring(), std::move(products));
}

Ideal Ideal::product(const Element& x) const {
  return product(makeIdeal(ring(), x));
}

Ideal Ideal::gcd(const Ideal& other) const {
  return sum(other);
}

Ideal Ideal::gcd(const Element& x) const {
  return sum(x);
}

Ideal Ideal::power(unsigned long exponent) const {
  auto result = makeIdeal(ring(), ring().one());
  auto square = *this;
  while (exponent != 0) {
    if (exponent & 1)
      result = result.product(square);
    exponent >>= 1;
    if (exponent != 0)
      square = square.product(square);
  }
  return result;
}

CompareResult Ideal::compare(const Ideal& other) const {
  if (!haveCommonRing(ring(), other.ring())) {
    // Ideals of unrelated rings are never equal.
    return ring().name() < other.ring().name() ? LessThan : GreaterThan;
  }

  switch (mKind) {
  case Generic:
  case Fractional: {
    if (isSubset(gens(), other.gens()) && isSubset(other.gens(), gens()))
      return EqualTo;
    const auto& a = gens();
    const auto& b = other.gens();
    const auto count = std::min(a.size(), b.size());
    for (size_t i = 0; i < count; ++i) {
      const auto cmp = a[i].compare(b[i]);
      if (cmp != EqualTo)
        return cmp;
    }
    if (a.size() == b.size())
      return EqualTo;
    return a.size() < b.size() ? LessThan : GreaterThan;
  }

  case Principal:
  case Pid:
    if (!other.isPrincipal().isTrue())
      return LessThan;
    if (isZero())
      return other.isZero() ? EqualTo : LessThan;
    if (other.isZero())
      return GreaterThan;
    if (gen().divides(other.gen()) && other.gen().divides(gen()))
      return EqualTo;
    return GreaterThan;
  }
  MATHICIDEAL_UNREACHABLE;
}

std::string Ideal::toString() const {
  std::ostringstream out;
  switch (mKind) {
  case Generic: out << "Ideal ("; break;
  case Principal:
  case Pid: out << "Principal ideal ("; break;
  case Fractional: out << "Fractional ideal ("; break;
  }
  for (auto it = mGens.begin(); it != mGens.end(); ++it) {
    if (it != mGens.begin())
      out << ", ";
    out << *it;
  }
  out << ") of " << ring().name();
  return out.str();
}

Ideal operator+(const Element& a, const Ideal& b) {
  return b.sum(a);
}

Ideal operator*(const Element& a, const Ideal& b) {
  return b.product(a);
}

std::ostream& operator<<(std::ostream& out, const Ideal& ideal) {
  return out << ideal.toString();
}

MATHICIDEAL_NAMESPACE_END
