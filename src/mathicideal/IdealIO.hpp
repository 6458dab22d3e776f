// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_IDEAL_IO_GUARD
#define MATHICIDEAL_IDEAL_IO_GUARD

#include "Scanner.hpp"
#include "PolyRing.hpp"
#include "Ideal.hpp"
#include <memory>
#include <ostream>

MATHICIDEAL_NAMESPACE_BEGIN

/// Input and output of rings, elements and ideals in the text format of
/// the mideal program. A file holds a ring followed by an ideal:
///
///   QQ[x, y]
///   2
///   x^2 - 1/2*y, x*y
///
/// Each writer is the inverse of the matching reader.
class IdealIO {
public:
  /// ZZ, QQ or GF(p).
  BaseRing readBaseRing(Scanner& in);
  void writeBaseRing(const BaseRing& base, std::ostream& out);

  /// A base ring optionally followed by variable names in brackets, as in
  /// GF(7)[x, y].
  std::unique_ptr<PolyRing> readRing(Scanner& in);
  void writeRing(const PolyRing& ring, std::ostream& out);

  /// Reads an element of ring. The grammar is
  ///
  ///   expr    := [+|-] product {(+|-) product}
  ///   product := power {* power}
  ///   power   := atom [^ integer]
  ///   atom    := integer [/ integer] | variable | ( expr )
  ///
  /// An unknown variable is a syntax error. A fraction that is not in the
  /// ring throws CoercionError.
  Element readElement(const Ring& ring, Scanner& in);
  void writeElement(const Element& element, std::ostream& out);

  /// Reads an optional "fractional", the number of generators and the
  /// generators separated by commas. The ideal is made by makeIdeal, or by
  /// makeFractionalIdeal after "fractional".
  Ideal readIdeal(const Ring& ring, Scanner& in);
  void writeIdeal(const Ideal& ideal, std::ostream& out);

private:
  Element readProduct(const Ring& ring, Scanner& in);
  Element readPower(const Ring& ring, Scanner& in);
  Element readAtom(const Ring& ring, Scanner& in);
};

MATHICIDEAL_NAMESPACE_END

#endif
