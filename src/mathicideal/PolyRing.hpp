// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_POLY_RING_GUARD
#define MATHICIDEAL_POLY_RING_GUARD

#include "Ring.hpp"
#include "Poly.hpp"
#include <gmpxx.h>
#include <string>
#include <vector>

MATHICIDEAL_NAMESPACE_BEGIN

/// The coefficient domain of a PolyRing: the integers, the rationals or a
/// prime field. Coefficients of all three are stored as mpq_class. A
/// coefficient is canonical if it is an integer for the integers, a
/// canonical fraction for the rationals and an integer in [0, p) for GF(p).
class BaseRing {
public:
  enum Kind {
    Integers,
    Rationals,
    PrimeField
  };

  static BaseRing integers() {return BaseRing(Integers, 0);}
  static BaseRing rationals() {return BaseRing(Rationals, 0);}

  /// Throws DomainError if charac is not a prime.
  static BaseRing primeField(const mpz_class& charac);

  Kind kind() const {return mKind;}
  bool isField() const {return mKind != Integers;}
  bool isFinite() const {return mKind == PrimeField;}

  /// Zero for the integers and the rationals.
  const mpz_class& charac() const {return mCharac;}

  /// "Integer Ring", "Rational Field" or "Finite Field of size p".
  std::string name() const;

  /// "ZZ", "QQ" or "GF(p)" - the syntax that IdealIO reads.
  std::string shortName() const;

  /// Returns true if every element of from has an image in this base.
  bool canCoerceFrom(const BaseRing& from) const;

  /// Puts c into canonical form. Returns false if c is not an element of
  /// this base, such as 1/2 in the integers or 1/p in GF(p).
  bool canonicalize(Coefficient& c) const;

  /// As canonicalize, but computes in the field of fractions of this base,
  /// so the integers act as the rationals. Always succeeds for a fraction
  /// with nonzero denominator except 1/p in GF(p), which is an error.
  void canonicalizeInFractionField(Coefficient& c) const;

  bool isUnit(const Coefficient& c) const;

  bool operator==(const BaseRing& b) const {
    return mKind == b.mKind && mCharac == b.mCharac;
  }
  bool operator!=(const BaseRing& b) const {return !(*this == b);}

private:
  BaseRing(Kind kind, const mpz_class& charac): mKind(kind), mCharac(charac) {}

  Kind mKind;
  mpz_class mCharac;
};

/// A commutative polynomial ring over a BaseRing in a list of named
/// variables. With no variables it is the base ring itself, so
/// PolyRing(BaseRing::integers(), {}) is the integers.
///
/// Terms are kept in descending graded reverse lexicographic order.
class PolyRing : public Ring {
public:
  typedef Poly::ConstMonoPtr ConstMonoPtr;

  /// Throws DomainError if a variable name is not an identifier or if two
  /// variables have the same name.
  PolyRing(BaseRing base, std::vector<std::string> variableNames);

  const BaseRing& base() const {return mBase;}

  /// "ZZ", "QQ[x, y]", "GF(7)[t]" and so on.
  std::string shortName() const;

  /// Returns true if the rings have the same base and the same variables
  /// in the same order.
  bool sameAs(const PolyRing& ring) const;

  virtual std::string name() const;

  virtual bool isCommutative() const {return true;}
  virtual bool isPrincipalIdealDomain() const;
  virtual bool isField() const;
  virtual bool baseRingOrder(mpz_class& order) const;

  virtual VarIndex varCount() const {return mVarNames.size();}
  virtual std::string variableName(VarIndex var) const;
  virtual VarIndex variableIndex(const std::string& name) const;
  virtual Element gen(VarIndex var) const;

  virtual Element fromInteger(const mpz_class& value) const;
  virtual Element fromRational(const mpq_class& value) const;
  virtual Element makeElement(Poly poly) const;

  virtual bool canCoerceFrom(const Ring& ring) const;
  virtual Element coerce(const Element& x) const;

  virtual bool isZero(const Element& a) const;
  virtual bool isUnit(const Element& a) const;
  virtual bool equal(const Element& a, const Element& b) const;
  virtual CompareResult compare(const Element& a, const Element& b) const;

  virtual Element add(const Element& a, const Element& b) const;
  virtual Element subtract(const Element& a, const Element& b) const;
  virtual Element negate(const Element& a) const;
  virtual Element multiply(const Element& a, const Element& b) const;

  virtual bool divides(const Element& a, const Element& b) const;
  virtual Element gcd(const Element& a, const Element& b) const;
  virtual void quoRem(
    const Element& a,
    const Element& b,
    Element& quotient,
    Element& remainder
  ) const;

  virtual std::string toString(const Element& a) const;

  /// Graded reverse lexicographic comparison of exponent vectors.
  CompareResult monomialCompare(ConstMonoPtr a, ConstMonoPtr b) const;

  /// Returns true if the monomial a divides the monomial b.
  bool monomialDivides(ConstMonoPtr a, ConstMonoPtr b) const;

  /// Sets prod to a times b. Throws DomainError if the degree of the
  /// product does not fit in an Exponent.
  void monomialProduct(ConstMonoPtr a, ConstMonoPtr b, Exponent* prod) const;

private:
  /// Sorts, combines like terms and canonicalizes coefficients. Computes in
  /// the field of fractions if fractionField is true - otherwise a
  /// coefficient that is not in the base causes a CoercionError.
  Poly normalize(Poly poly, bool fractionField) const;

  /// Returns a + c * m * b where m is a monomial, in the field of fractions.
  Poly addMultiple(
    const Poly& a,
    const Coefficient& c,
    const std::vector<Exponent>& m,
    const Poly& b
  ) const;

  /// Division of f by the single polynomial g in the field of fractions of
  /// the base. The remainder has no term divisible by the lead term of g.
  void divide(
    const Poly& f,
    const Poly& g,
    Poly& quotient,
    Poly& remainder
  ) const;

  void checkMember(const Element& a) const;

  BaseRing mBase;
  std::vector<std::string> mVarNames;
};

MATHICIDEAL_NAMESPACE_END

#endif
