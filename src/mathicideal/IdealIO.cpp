// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "IdealIO.hpp"

#include "IdealFactory.hpp"
#include "Errors.hpp"
#include <string>
#include <vector>

MATHICIDEAL_NAMESPACE_BEGIN

BaseRing IdealIO::readBaseRing(Scanner& in) {
  const auto name = in.readIdentifier();
  if (name == "ZZ")
    return BaseRing::integers();
  if (name == "QQ")
    return BaseRing::rationals();
  if (name != "GF")
    in.reportErrorUnexpectedToken("ZZ, QQ or GF", '\"' + name + '\"');

  in.expect('(');
  const auto charac = in.readMpz();
  in.expect(')');
  return BaseRing::primeField(charac);
}

void IdealIO::writeBaseRing(const BaseRing& base, std::ostream& out) {
  out << base.shortName();
}

std::unique_ptr<PolyRing> IdealIO::readRing(Scanner& in) {
  auto base = readBaseRing(in);
  std::vector<std::string> names;
  if (in.match('[') && !in.match(']')) {
    do {
      names.push_back(in.readIdentifier());
    } while (in.match(','));
    in.expect(']');
  }
  return ::mid::make_unique<PolyRing>(std::move(base), std::move(names));
}

void IdealIO::writeRing(const PolyRing& ring, std::ostream& out) {
  out << ring.shortName();
}

Element IdealIO::readElement(const Ring& ring, Scanner& in) {
  bool negate = false;
  if (in.match('-'))
    negate = true;
  else
    in.match('+');

  auto sum = readProduct(ring, in);
  if (negate)
    sum = ring.negate(sum);
  while (true) {
    if (in.match('+'))
      sum = ring.add(sum, readProduct(ring, in));
    else if (in.match('-'))
      sum = ring.subtract(sum, readProduct(ring, in));
    else
      break;
  }
  return sum;
}

Element IdealIO::readProduct(const Ring& ring, Scanner& in) {
  auto product = readPower(ring, in);
  while (in.match('*'))
    product = ring.multiply(product, readPower(ring, in));
  return product;
}

Element IdealIO::readPower(const Ring& ring, Scanner& in) {
  const auto atom = readAtom(ring, in);
  if (!in.match('^'))
    return atom;
  return atom.pow(in.readInteger<Exponent>());
}

Element IdealIO::readAtom(const Ring& ring, Scanner& in) {
  if (in.match('(')) {
    const auto e = readElement(ring, in);
    in.expect(')');
    return e;
  }

  if (in.peekIdentifier()) {
    const auto name = in.readIdentifier();
    const auto var = ring.variableIndex(name);
    if (var == ring.varCount())
      in.reportError("Unknown variable \"" + name + "\" in " +
        ring.name() + '.');
    return ring.gen(var);
  }

  if (!in.peekDigit())
    in.reportErrorUnexpectedToken
      ("an integer, a variable or '('", in.peekWhite());
  const auto numerator = in.readMpz();
  if (!in.match('/'))
    return ring.fromInteger(numerator);
  const auto denominator = in.readMpz();
  if (denominator == 0)
    in.reportError("Division by zero.");
  return ring.fromRational(mpq_class(numerator, denominator));
}

void IdealIO::writeElement(const Element& element, std::ostream& out) {
  out << element.toString();
}

Ideal IdealIO::readIdeal(const Ring& ring, Scanner& in) {
  bool fractional = false;
  if (in.peekIdentifier()) {
    const auto keyword = in.readIdentifier();
    if (keyword != "fractional")
      in.reportErrorUnexpectedToken
        ("\"fractional\" or a generator count", '\"' + keyword + '\"');
    fractional = true;
  }

  const auto genCount = in.readInteger<size_t>();
  std::vector<Element> gens;
  gens.reserve(genCount);
  for (size_t i = 0; i < genCount; ++i) {
    if (i != 0)
      in.expect(',');
    gens.push_back(readElement(ring, in));
  }

  if (fractional)
    return makeFractionalIdeal(ring, std::move(gens), false);
  return makeIdeal(ring, std::move(gens), false);
}

void IdealIO::writeIdeal(const Ideal& ideal, std::ostream& out) {
  if (ideal.kind() == Ideal::Fractional)
    out << "fractional ";
  out << ideal.genCount() << '\n';
  const auto& gens = ideal.gens();
  for (auto it = gens.begin(); it != gens.end(); ++it) {
    if (it != gens.begin())
      out << ", ";
    writeElement(*it, out);
  }
  out << '\n';
}

MATHICIDEAL_NAMESPACE_END
