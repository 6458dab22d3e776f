// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "PolyRing.hpp"

#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

MATHICIDEAL_NAMESPACE_BEGIN

namespace {
  bool isIdentifier(const std::string& str) {
    if (str.empty())
      return false;
    if (!std::isalpha(static_cast<unsigned char>(str[0])) && str[0] != '_')
      return false;
    for (size_t i = 1; i < str.size(); ++i)
      if (!std::isalnum(static_cast<unsigned char>(str[i])) && str[i] != '_')
        return false;
    return true;
  }

  /// Returns the value of a constant polynomial.
  Coefficient constantValue(const Poly& poly) {
    MATHICIDEAL_ASSERT(poly.isConstant());
    MATHICIDEAL_ASSERT(poly.termCount() <= 1);
    return poly.isZero() ? Coefficient(0) : poly.coef(0);
  }

  void checkDegree(int64 degree) {
    if (degree > std::numeric_limits<Exponent>::max()) {
      std::ostringstream err;
      err << "The degree " << degree << " is larger than the largest "
        "supported degree " << std::numeric_limits<Exponent>::max() << '.';
      throw DomainError(err.str());
    }
  }
}

BaseRing BaseRing::primeField(const mpz_class& charac) {
  if (charac < 2 || mpz_probab_prime_p(charac.get_mpz_t(), 25) == 0) {
    std::ostringstream err;
    err << "The characteristic of a prime field must be a prime, not "
      << charac << '.';
    throw DomainError(err.str());
  }
  return BaseRing(PrimeField, charac);
}

std::string BaseRing::name() const {
  switch (mKind) {
  case Integers: return "Integer Ring";
  case Rationals: return "Rational Field";
  case PrimeField: return "Finite Field of size " + mCharac.get_str();
  }
  MATHICIDEAL_UNREACHABLE;
}

std::string BaseRing::shortName() const {
  switch (mKind) {
  case Integers: return "ZZ";
  case Rationals: return "QQ";
  case PrimeField: return "GF(" + mCharac.get_str() + ')';
  }
  MATHICIDEAL_UNREACHABLE;
}

bool BaseRing::canCoerceFrom(const BaseRing& from) const {
  switch (from.kind()) {
  case Integers: return true;
  case Rationals: return mKind == Rationals;
  case PrimeField: return *this == from;
  }
  MATHICIDEAL_UNREACHABLE;
}

bool BaseRing::canonicalize(Coefficient& c) const {
  c.canonicalize();
  switch (mKind) {
  case Integers:
    return c.get_den() == 1;

  case Rationals:
    return true;

  case PrimeField: {
    mpz_class den;
    mpz_fdiv_r(den.get_mpz_t(), c.get_den_mpz_t(), mCharac.get_mpz_t());
    if (den == 0)
      return false;
    mpz_class num;
    mpz_fdiv_r(num.get_mpz_t(), c.get_num_mpz_t(), mCharac.get_mpz_t());
    if (den != 1) {
      mpz_class inverse;
      mpz_invert(inverse.get_mpz_t(), den.get_mpz_t(), mCharac.get_mpz_t());
      num *= inverse;
      mpz_fdiv_r(num.get_mpz_t(), num.get_mpz_t(), mCharac.get_mpz_t());
    }
    c = num;
    return true;
  }
  }
  MATHICIDEAL_UNREACHABLE;
}

void BaseRing::canonicalizeInFractionField(Coefficient& c) const {
  if (mKind == PrimeField) {
    const bool ok = canonicalize(c);
    MATHICIDEAL_ASSERT(ok);
    (void)ok;
  } else
    c.canonicalize();
}

bool BaseRing::isUnit(const Coefficient& c) const {
  if (mKind == Integers)
    return c == 1 || c == -1;
  return c != 0;
}

PolyRing::PolyRing(BaseRing base, std::vector<std::string> variableNames):
  mBase(std::move(base)),
  mVarNames(std::move(variableNames))
{
  for (size_t i = 0; i < mVarNames.size(); ++i) {
    if (!isIdentifier(mVarNames[i]))
      throw DomainError
        ("Variable name \"" + mVarNames[i] + "\" is not an identifier.");
    for (size_t j = 0; j < i; ++j)
      if (mVarNames[i] == mVarNames[j])
        throw DomainError
          ("Variable \"" + mVarNames[i] + "\" is named more than once.");
  }
}

std::string PolyRing::shortName() const {
  std::string str = mBase.shortName();
  if (varCount() == 0)
    return str;
  str += '[';
  for (VarIndex var = 0; var < varCount(); ++var) {
    if (var != 0)
      str += ", ";
    str += mVarNames[var];
  }
  return str + ']';
}

bool PolyRing::sameAs(const PolyRing& ring) const {
  return mBase == ring.mBase && mVarNames == ring.mVarNames;
}

std::string PolyRing::name() const {
  if (varCount() == 0)
    return mBase.name();
  std::string str = varCount() == 1 ?
    "Univariate Polynomial Ring in " : "Multivariate Polynomial Ring in ";
  for (VarIndex var = 0; var < varCount(); ++var) {
    if (var != 0)
      str += ", ";
    str += mVarNames[var];
  }
  return str + " over " + mBase.name();
}

bool PolyRing::isPrincipalIdealDomain() const {
  return varCount() == 0 || (varCount() == 1 && mBase.isField());
}

bool PolyRing::isField() const {
  return varCount() == 0 && mBase.isField();
}

bool PolyRing::baseRingOrder(mpz_class& order) const {
  if (!mBase.isFinite())
    return false;
  order = mBase.charac();
  return true;
}

std::string PolyRing::variableName(VarIndex var) const {
  MATHICIDEAL_ASSERT(var < varCount());
  return mVarNames[var];
}

VarIndex PolyRing::variableIndex(const std::string& name) const {
  const auto it = std::find(mVarNames.begin(), mVarNames.end(), name);
  return static_cast<VarIndex>(it - mVarNames.begin());
}

Element PolyRing::gen(VarIndex var) const {
  if (var >= varCount()) {
    std::ostringstream err;
    err << "Variable index " << var << " is out of range for " << name();
    throw DomainError(err.str());
  }
  std::vector<Exponent> mono(varCount());
  mono[var] = 1;
  Poly poly(varCount());
  poly.append(1, mono.data());
  return Element(*this, std::move(poly));
}

Element PolyRing::fromInteger(const mpz_class& value) const {
  Poly poly(varCount());
  poly.appendConstant(Coefficient(value));
  return makeElement(std::move(poly));
}

Element PolyRing::fromRational(const mpq_class& value) const {
  Poly poly(varCount());
  poly.appendConstant(value);
  return makeElement(std::move(poly));
}

Element PolyRing::makeElement(Poly poly) const {
  if (poly.varCount() != varCount())
    throw DomainError("Polynomial has the wrong number of variables for " +
      name() + '.');
  for (size_t term = 0; term < poly.termCount(); ++term) {
    int64 degree = 0;
    for (VarIndex var = 0; var < varCount(); ++var) {
      const auto e = poly.exponent(term, var);
      if (e < 0)
        throw DomainError("Polynomial has a negative exponent.");
      degree += e;
    }
    checkDegree(degree);
  }
  return Element(*this, normalize(std::move(poly), false));
}

bool PolyRing::canCoerceFrom(const Ring& ring) const {
  if (&ring == this)
    return true;
  const auto from = dynamic_cast<const PolyRing*>(&ring);
  if (from == nullptr || !mBase.canCoerceFrom(from->base()))
    return false;
  for (VarIndex var = 0; var < from->varCount(); ++var)
    if (variableIndex(from->variableName(var)) == varCount())
      return false;
  return true;
}

Element PolyRing::coerce(const Element& x) const {
  if (!x.hasRing())
    throw CoercionError("Cannot coerce a value without a ring into " +
      name() + '.');
  if (&x.ring() == this)
    return x;
  const auto cannot = [&](const std::string& why) {
    return CoercionError("Cannot coerce " + x.toString() + " from " +
      x.ring().name() + " into " + name() + ": " + why);
  };

  const auto from = dynamic_cast<const PolyRing*>(&x.ring());
  if (from == nullptr)
    throw cannot("unrelated kind of ring.");
  if (from->sameAs(*this))
    return Element(*this, x.poly());
  if (from->base().isFinite() && from->base() != mBase)
    throw cannot("elements of a finite field only map to that field.");

  std::vector<VarIndex> varMap(from->varCount());
  for (VarIndex var = 0; var < from->varCount(); ++var)
    varMap[var] = variableIndex(from->variableName(var));

  const auto& fromPoly = x.poly();
  Poly poly(varCount());
  poly.reserve(fromPoly.termCount());
  std::vector<Exponent> mono(varCount());
  for (size_t term = 0; term < fromPoly.termCount(); ++term) {
    std::fill(mono.begin(), mono.end(), 0);
    for (VarIndex var = 0; var < from->varCount(); ++var) {
      const auto e = fromPoly.exponent(term, var);
      if (e == 0)
        continue;
      if (varMap[var] == varCount())
        throw cannot("no variable named " + from->variableName(var) + '.');
      mono[varMap[var]] = e;
    }
    poly.append(fromPoly.coef(term), mono.data());
  }
  try {
    return Element(*this, normalize(std::move(poly), false));
  } catch (const CoercionError& e) {
    throw cannot(e.what());
  }
}

bool PolyRing::isZero(const Element& a) const {
  checkMember(a);
  return a.poly().isZero();
}

bool PolyRing::isUnit(const Element& a) const {
  checkMember(a);
  const auto& poly = a.poly();
  return poly.termCount() == 1 && poly.isConstant() &&
    mBase.isUnit(poly.coef(0));
}

bool PolyRing::equal(const Element& a, const Element& b) const {
  checkMember(a);
  checkMember(b);
  return a.poly() == b.poly();
}

CompareResult PolyRing::compare(const Element& a, const Element& b) const {
  checkMember(a);
  checkMember(b);
  const auto& pa = a.poly();
  const auto& pb = b.poly();
  if (pa.isConstant() && pb.isConstant()) {
    const int sign = ::cmp(constantValue(pa), constantValue(pb));
    return sign < 0 ? LessThan : sign > 0 ? GreaterThan : EqualTo;
  }

  const auto count = std::min(pa.termCount(), pb.termCount());
  for (size_t i = 0; i < count; ++i) {
    const auto monoCmp = monomialCompare(pa.mono(i), pb.mono(i));
    if (monoCmp != EqualTo)
      return monoCmp;
    if (pa.coef(i) < pb.coef(i))
      return LessThan;
    if (pb.coef(i) < pa.coef(i))
      return GreaterThan;
  }
  if (pa.termCount() == pb.termCount())
    return EqualTo;
  return pa.termCount() < pb.termCount() ? LessThan : GreaterThan;
}

Element PolyRing::add(const Element& a, const Element& b) const {
  checkMember(a);
  checkMember(b);
  Poly sum(a.poly());
  sum.reserve(a.poly().termCount() + b.poly().termCount());
  const auto& pb = b.poly();
  for (size_t i = 0; i < pb.termCount(); ++i)
    sum.append(pb.coef(i), pb.mono(i));
  return Element(*this, normalize(std::move(sum), false));
}

Element PolyRing::subtract(const Element& a, const Element& b) const {
  return add(a, negate(b));
}

Element PolyRing::negate(const Element& a) const {
  checkMember(a);
  Poly neg(a.poly());
  for (size_t i = 0; i < neg.termCount(); ++i)
    neg.coef(i) = -neg.coef(i);
  return Element(*this, normalize(std::move(neg), false));
}

Element PolyRing::multiply(const Element& a, const Element& b) const {
  checkMember(a);
  checkMember(b);
  const auto& pa = a.poly();
  const auto& pb = b.poly();
  Poly prod(varCount());
  prod.reserve(pa.termCount() * pb.termCount());
  std::vector<Exponent> mono(varCount());
  for (size_t i = 0; i < pa.termCount(); ++i) {
    for (size_t j = 0; j < pb.termCount(); ++j) {
      monomialProduct(pa.mono(i), pb.mono(j), mono.data());
      prod.append(pa.coef(i) * pb.coef(j), mono.data());
    }
  }
  return Element(*this, normalize(std::move(prod), false));
}

bool PolyRing::divides(const Element& a, const Element& b) const {
  checkMember(a);
  checkMember(b);
  if (a.poly().isZero())
    return b.poly().isZero();
  if (b.poly().isZero())
    return true;

  Poly quotient;
  Poly remainder;
  divide(b.poly(), a.poly(), quotient, remainder);
  if (!remainder.isZero())
    return false;
  if (mBase.kind() != BaseRing::Integers)
    return true;
  for (size_t i = 0; i < quotient.termCount(); ++i)
    if (quotient.coef(i).get_den() != 1)
      return false;
  return true;
}

Element PolyRing::gcd(const Element& a, const Element& b) const {
  checkMember(a);
  checkMember(b);
  if (varCount() == 0) {
    if (mBase.kind() == BaseRing::Integers) {
      mpz_class g;
      mpz_gcd(
        g.get_mpz_t(),
        constantValue(a.poly()).get_num_mpz_t(),
        constantValue(b.poly()).get_num_mpz_t()
      );
      return fromInteger(g);
    }
    return isZero(a) && isZero(b) ? zero() : one();
  }

  if (varCount() != 1 || !mBase.isField())
    throw NotImplementedCapability("gcd is not implemented for " + name());

  // Euclid's algorithm
  Poly x(a.poly());
  Poly y(b.poly());
  while (!y.isZero()) {
    Poly quotient;
    Poly remainder;
    divide(x, y, quotient, remainder);
    x.swap(y);
    y.swap(remainder);
  }
  if (x.isZero())
    return zero();

  const Coefficient leadCoef = x.leadCoef();
  for (size_t i = 0; i < x.termCount(); ++i) {
    x.coef(i) /= leadCoef;
    mBase.canonicalizeInFractionField(x.coef(i));
  }
  return Element(*this, std::move(x));
}

void PolyRing::quoRem(
  const Element& a,
  const Element& b,
  Element& quotient,
  Element& remainder
) const {
  checkMember(a);
  checkMember(b);
  if (b.poly().isZero())
    throw DomainError("Division by zero in " + name() + '.');

  if (mBase.kind() == BaseRing::Integers) {
    if (varCount() != 0)
      throw NotImplementedCapability
        ("Quotient with remainder is not implemented for " + name() + '.');
    mpz_class q;
    mpz_class r;
    mpz_fdiv_qr(
      q.get_mpz_t(),
      r.get_mpz_t(),
      constantValue(a.poly()).get_num_mpz_t(),
      constantValue(b.poly()).get_num_mpz_t()
    );
    quotient = fromInteger(q);
    remainder = fromInteger(r);
    return;
  }

  Poly q;
  Poly r;
  divide(a.poly(), b.poly(), q, r);
  quotient = Element(*this, std::move(q));
  remainder = Element(*this, std::move(r));
}

std::string PolyRing::toString(const Element& a) const {
  checkMember(a);
  const auto& poly = a.poly();
  if (poly.isZero())
    return "0";

  std::ostringstream out;
  for (size_t term = 0; term < poly.termCount(); ++term) {
    const auto& coef = poly.coef(term);
    const bool negative = coef < 0;
    if (term == 0) {
      if (negative)
        out << '-';
    } else
      out << (negative ? " - " : " + ");
    const Coefficient absCoef = abs(coef);

    bool first = true;
    for (VarIndex var = 0; var < varCount(); ++var) {
      const auto e = poly.exponent(term, var);
      if (e == 0)
        continue;
      if (first) {
        if (absCoef != 1)
          out << absCoef << '*';
        first = false;
      } else
        out << '*';
      out << mVarNames[var];
      if (e != 1)
        out << '^' << e;
    }
    if (first) // constant term
      out << absCoef;
  }
  return out.str();
}

CompareResult PolyRing::monomialCompare(
  ConstMonoPtr a,
  ConstMonoPtr b
) const {
  int64 degA = 0;
  int64 degB = 0;
  for (VarIndex var = 0; var < varCount(); ++var) {
    degA += a[var];
    degB += b[var];
  }
  if (degA != degB)
    return degA < degB ? LessThan : GreaterThan;

  // Reverse lex: the monomial with the smaller exponent in the last
  // variable where they differ is the greater one.
  for (VarIndex var = varCount(); var > 0; --var) {
    if (a[var - 1] != b[var - 1])
      return a[var - 1] < b[var - 1] ? GreaterThan : LessThan;
  }
  return EqualTo;
}

bool PolyRing::monomialDivides(ConstMonoPtr a, ConstMonoPtr b) const {
  for (VarIndex var = 0; var < varCount(); ++var)
    if (a[var] > b[var])
      return false;
  return true;
}

void PolyRing::monomialProduct(
  ConstMonoPtr a,
  ConstMonoPtr b,
  Exponent* prod
) const {
  int64 degree = 0;
  for (VarIndex var = 0; var < varCount(); ++var)
    degree += static_cast<int64>(a[var]) + b[var];
  checkDegree(degree);
  for (VarIndex var = 0; var < varCount(); ++var)
    prod[var] = a[var] + b[var];
}

Poly PolyRing::normalize(Poly poly, bool fractionField) const {
  MATHICIDEAL_ASSERT(poly.varCount() == varCount());

  // Sort term indices rather than terms, since moving a term means moving
  // a whole exponent vector.
  std::vector<size_t> order(poly.termCount());
  for (size_t i = 0; i < order.size(); ++i)
    order[i] = i;
  std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return monomialCompare(poly.mono(a), poly.mono(b)) == GreaterThan;
  });

  Poly result(varCount());
  result.reserve(poly.termCount());
  size_t i = 0;
  while (i < order.size()) {
    const auto mono = poly.mono(order[i]);
    Coefficient sum = poly.coef(order[i]);
    for (++i; i < order.size(); ++i) {
      if (monomialCompare(poly.mono(order[i]), mono) != EqualTo)
        break;
      sum += poly.coef(order[i]);
    }

    if (fractionField)
      mBase.canonicalizeInFractionField(sum);
    else if (!mBase.canonicalize(sum)) {
      std::ostringstream err;
      err << "The coefficient " << sum << " is not an element of "
        << mBase.name() << '.';
      throw CoercionError(err.str());
    }
    if (sum != 0)
      result.append(sum, mono);
  }
  return result;
}

Poly PolyRing::addMultiple(
  const Poly& a,
  const Coefficient& c,
  const std::vector<Exponent>& m,
  const Poly& b
) const {
  MATHICIDEAL_ASSERT(m.size() == varCount());
  Poly sum(a);
  sum.reserve(a.termCount() + b.termCount());
  std::vector<Exponent> mono(varCount());
  for (size_t i = 0; i < b.termCount(); ++i) {
    monomialProduct(m.data(), b.mono(i), mono.data());
    sum.append(c * b.coef(i), mono.data());
  }
  return normalize(std::move(sum), true);
}

void PolyRing::divide(
  const Poly& f,
  const Poly& g,
  Poly& quotient,
  Poly& remainder
) const {
  MATHICIDEAL_ASSERT(!g.isZero());
  Poly p(f);
  quotient = Poly(varCount());
  remainder = Poly(varCount());
  std::vector<Exponent> m(varCount());
  while (!p.isZero()) {
    if (monomialDivides(g.leadMono(), p.leadMono())) {
      Coefficient c = p.leadCoef() / g.leadCoef();
      mBase.canonicalizeInFractionField(c);
      for (VarIndex var = 0; var < varCount(); ++var)
        m[var] = p.leadMono()[var] - g.leadMono()[var];
      quotient.append(c, m.data());
      p = addMultiple(p, -c, m, g);
    } else {
      remainder.append(p.leadCoef(), p.leadMono());
      Poly rest(varCount());
      rest.reserve(p.termCount() - 1);
      for (size_t i = 1; i < p.termCount(); ++i)
        rest.append(p.coef(i), p.mono(i));
      p.swap(rest);
    }
  }
}

void PolyRing::checkMember(const Element& a) const {
  if (!a.hasRing() || &a.ring() != this)
    throw TypeError(a.toString() + " is not an element of " + name() + '.');
}

MATHICIDEAL_NAMESPACE_END
