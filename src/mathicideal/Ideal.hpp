// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_IDEAL_GUARD
#define MATHICIDEAL_IDEAL_GUARD

#include "Element.hpp"
#include "Decision.hpp"
#include <ostream>
#include <string>
#include <vector>

MATHICIDEAL_NAMESPACE_BEGIN

class Ring;
class IdealRequest;

/// An ideal of a commutative ring, given by a finite list of generators.
///
/// Ideal is an immutable value. The kind is decided when the ideal is made
/// by makeIdeal (see IdealFactory.hpp) and it decides which algorithms the
/// ideal uses:
///
///   Generic     any number of generators, membership is not decidable.
///   Principal   one generator in a ring that is not a PID. Membership is
///               divisibility by the generator.
///   Pid         one generator in a principal ideal domain. The generator is
///               the gcd of the generators the ideal was made from, sums are
///               gcds and reduction is the remainder of division.
///   Fractional  as Generic, for ideals that live in a field of fractions.
///
/// The generator list never contains two equal elements and it is never
/// empty - the zero ideal has the single generator zero. Two ideals are
/// equal if their generator sets are equal, whatever the order of the
/// generators.
///
/// An Ideal refers to its ring, so the ring must outlive the ideal.
class Ideal {
public:
  enum Kind {
    Generic,
    Principal,
    Pid,
    Fractional
  };

  const Ring& ring() const {return *mRing;}
  Kind kind() const {return mKind;}

  const std::vector<Element>& gens() const {return mGens;}
  const std::vector<Element>& gensReduced() const {return gens();}
  size_t genCount() const {return mGens.size();}

  /// The single generator. Throws NotImplementedCapability if there is more
  /// than one generator.
  const Element& gen() const;

  /// Returns true if this is the zero ideal.
  bool isZero() const;

  /// "Category of ring ideals in R".
  std::string category() const;

  // *** Questions

  /// Coerces x into the ring and decides whether it lies in the ideal. An x
  /// that cannot be coerced is not in the ideal.
  Decision contains(const Element& x) const;

  Decision isPrincipal() const;

  /// Is this the zero ideal or the unit ideal?
  Decision isTrivial() const;

  Decision isPrime() const;
  Decision isMaximal() const;

  /// Returns true if this ideal divides other, which is to say that other is
  /// contained in this ideal. Throws NotImplementedCapability unless both
  /// ideals are principal.
  bool divides(const Ideal& other) const;

  // *** Reduction

  /// Returns a canonical representative of the class of f modulo this
  /// ideal. Only Pid ideals reduce - for the other kinds this returns f.
  Element reduce(const Element& f) const;

  // *** Arithmetic. The result is made by makeIdeal, so it is classified
  // again. An Element operand stands for the ideal it generates in ring().

  Ideal sum(const Ideal& other) const;
  Ideal sum(const Element& x) const;

  Ideal product(const Ideal& other) const;
  Ideal product(const Element& x) const;

  /// The smallest ideal containing both ideals. That is the sum, and for a
  /// Pid ideal it is computed as a gcd.
  Ideal gcd(const Ideal& other) const;
  Ideal gcd(const Element& x) const;

  /// power(0) is the unit ideal.
  Ideal power(unsigned long exponent) const;

  /// Orders ideals according to the kind of this ideal.
  ///
  /// Generic and Fractional: EqualTo if the generator sets are equal,
  /// otherwise the generator lists are compared lexicographically. This
  /// order is deterministic but means nothing mathematically.
  ///
  /// Principal and Pid: an approximate order. A non-principal other is
  /// greater. A zero ideal is less than a nonzero one. Ideals whose
  /// generators divide each other are equal. Otherwise this ideal is
  /// greater. Two ideals can each be greater than the other, so this is not
  /// the lattice of ideals ordered by containment.
  CompareResult compare(const Ideal& other) const;

  /// "Ideal (x, y) of R", "Principal ideal (x) of R" or
  /// "Fractional ideal (x, y) of R".
  std::string toString() const;

private:
  friend Ideal makeIdeal(const IdealRequest& request);
  friend Ideal makeFractionalIdeal
    (const Ring& ring, std::vector<Element> gens, bool coerce);

  /// gens must be normalized generators of ring that satisfy the
  /// constraints of kind.
  Ideal(const Ring& ring, Kind kind, std::vector<Element> gens);

  const Ring* mRing;
  Kind mKind;
  std::vector<Element> mGens;
};

const char* kindName(Ideal::Kind kind);

inline bool operator==(const Ideal& a, const Ideal& b) {
  return a.compare(b) == EqualTo;
}
inline bool operator!=(const Ideal& a, const Ideal& b) {return !(a == b);}
inline bool operator<(const Ideal& a, const Ideal& b) {
  return a.compare(b) == LessThan;
}

inline Ideal operator+(const Ideal& a, const Ideal& b) {return a.sum(b);}
inline Ideal operator+(const Ideal& a, const Element& b) {return a.sum(b);}
Ideal operator+(const Element& a, const Ideal& b);

inline Ideal operator*(const Ideal& a, const Ideal& b) {return a.product(b);}
inline Ideal operator*(const Ideal& a, const Element& b) {
  return a.product(b);
}
Ideal operator*(const Element& a, const Ideal& b);

std::ostream& operator<<(std::ostream& out, const Ideal& ideal);

MATHICIDEAL_NAMESPACE_END

#endif
