// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_POLY_GUARD
#define MATHICIDEAL_POLY_GUARD

#include <gmpxx.h>
#include <vector>
#include <algorithm>

MATHICIDEAL_NAMESPACE_BEGIN

typedef mpq_class Coefficient;
typedef int32 Exponent;
typedef size_t VarIndex;

enum CompareResult {
  LessThan = -1,
  EqualTo = 0,
  GreaterThan = 1
};

/// A sparse polynomial: a list of terms where each term is a coefficient and
/// an exponent vector of length varCount(). The exponent vectors of all the
/// terms are stored one after the other in a single vector.
///
/// Poly is only a container. It is the ring that decides what a valid
/// coefficient is and in which order the terms must be kept - see PolyRing.
/// A constant has varCount() zero exponents, so a Poly with varCount() == 0
/// is a number.
class Poly {
public:
  typedef const Exponent* ConstMonoPtr;

  explicit Poly(VarIndex varCount = 0): mVarCount(varCount) {}

  VarIndex varCount() const {return mVarCount;}
  bool isZero() const {return mCoefs.empty();}
  size_t termCount() const {return mCoefs.size();}

  const Coefficient& coef(size_t index) const {
    MATHICIDEAL_ASSERT(index < termCount());
    return mCoefs[index];
  }

  Coefficient& coef(size_t index) {
    MATHICIDEAL_ASSERT(index < termCount());
    return mCoefs[index];
  }

  /// Returns the exponent vector of the given term. The pointer is
  /// invalidated by append().
  ConstMonoPtr mono(size_t index) const {
    MATHICIDEAL_ASSERT(index < termCount());
    return mMonos.data() + index * mVarCount;
  }

  Exponent exponent(size_t index, VarIndex var) const {
    MATHICIDEAL_ASSERT(var < varCount());
    return mono(index)[var];
  }

  const Coefficient& leadCoef() const {
    MATHICIDEAL_ASSERT(!isZero());
    return mCoefs.front();
  }

  ConstMonoPtr leadMono() const {
    MATHICIDEAL_ASSERT(!isZero());
    return mono(0);
  }

  /// Sum of the exponents of the given term. PolyRing keeps this within
  /// the range of Exponent.
  Exponent degree(size_t index) const {
    const auto m = mono(index);
    Exponent deg = 0;
    for (VarIndex var = 0; var < mVarCount; ++var)
      deg += m[var];
    return deg;
  }

  /// The largest degree of any term. The zero polynomial has degree 0 here.
  Exponent totalDegree() const {
    Exponent deg = 0;
    for (size_t i = 0; i < termCount(); ++i)
      deg = std::max(deg, degree(i));
    return deg;
  }

  /// Returns true if every exponent of every term is zero.
  bool isConstant() const {
    return std::all_of
      (mMonos.begin(), mMonos.end(), [](Exponent e) {return e == 0;});
  }

  /// Appends the given term as the last term in the polynomial. mono must
  /// point to varCount() exponents. mono may not point into this Poly.
  void append(const Coefficient& coef, ConstMonoPtr mono) {
    mCoefs.push_back(coef);
    mMonos.insert(mMonos.end(), mono, mono + mVarCount);
  }

  /// Appends coef times the monomial with all exponents zero.
  void appendConstant(const Coefficient& coef) {
    mCoefs.push_back(coef);
    mMonos.resize(mMonos.size() + mVarCount, 0);
  }

  /// Hint that space for the give number of terms is going to be needed.
  /// This serves the same purpose as std::vector<>::reserve.
  void reserve(size_t spaceForThisManyTerms) {
    mCoefs.reserve(spaceForThisManyTerms);
    mMonos.reserve(spaceForThisManyTerms * mVarCount);
  }

  void setToZero() {
    mCoefs.clear();
    mMonos.clear();
  }

  void swap(Poly& poly) {
    std::swap(mVarCount, poly.mVarCount);
    mCoefs.swap(poly.mCoefs);
    mMonos.swap(poly.mMonos);
  }

  /// Compares term by term. Both polynomials must keep their terms in the
  /// same order for this to be equality of polynomials.
  friend bool operator==(const Poly& a, const Poly& b) {
    return a.mVarCount == b.mVarCount &&
      a.mCoefs == b.mCoefs &&
      a.mMonos == b.mMonos;
  }

  friend bool operator!=(const Poly& a, const Poly& b) {return !(a == b);}

private:
  VarIndex mVarCount;
  std::vector<Coefficient> mCoefs;
  std::vector<Exponent> mMonos;
};

MATHICIDEAL_NAMESPACE_END

#endif
