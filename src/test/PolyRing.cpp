// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "mathicideal/stdinc.h"

#include "mathicideal/PolyRing.hpp"
#include "mathicideal/Errors.hpp"
#include "testHelpers.hpp"
#include <gtest/gtest.h>

using namespace mid;

TEST(PolyRing, Names) {
  EXPECT_EQ("Integer Ring", ringFromString("ZZ")->name());
  EXPECT_EQ("Rational Field", ringFromString("QQ")->name());
  EXPECT_EQ("Finite Field of size 7", ringFromString("GF(7)")->name());
  EXPECT_EQ("Univariate Polynomial Ring in t over Integer Ring",
    ringFromString("ZZ[t]")->name());
  EXPECT_EQ("Multivariate Polynomial Ring in x, y over Rational Field",
    ringFromString("QQ[x, y]")->name());
  EXPECT_EQ("GF(7)[a, b]", ringFromString("GF(7)[a,b]")->shortName());
}

TEST(PolyRing, BadParameters) {
  EXPECT_THROW(BaseRing::primeField(6), DomainError);
  EXPECT_THROW(BaseRing::primeField(1), DomainError);
  EXPECT_NO_THROW(BaseRing::primeField(32003));

  std::vector<std::string> twice;
  twice.push_back("x");
  twice.push_back("x");
  EXPECT_THROW(PolyRing(BaseRing::rationals(), twice), DomainError);
  EXPECT_THROW
    (PolyRing(BaseRing::rationals(), std::vector<std::string>(1, "1x")),
    DomainError);
  // Non-ASCII names are rejected.
  EXPECT_THROW(PolyRing(BaseRing::rationals(),
    std::vector<std::string>(1, "\xC3\xA9")), DomainError);
  EXPECT_THROW(PolyRing(BaseRing::rationals(),
    std::vector<std::string>(1, "x\xFF")), DomainError);

  const auto ring = ringFromString("QQ[x, y]");
  EXPECT_THROW(ring->gen(2), DomainError);
}

TEST(PolyRing, Capabilities) {
  const auto zz = ringFromString("ZZ");
  EXPECT_TRUE(zz->isCommutative());
  EXPECT_TRUE(zz->isPrincipalIdealDomain());
  EXPECT_FALSE(zz->isField());

  const auto qq = ringFromString("QQ");
  EXPECT_TRUE(qq->isPrincipalIdealDomain());
  EXPECT_TRUE(qq->isField());

  const auto qqx = ringFromString("QQ[x]");
  EXPECT_TRUE(qqx->isPrincipalIdealDomain());
  EXPECT_FALSE(qqx->isField());

  EXPECT_FALSE(ringFromString("ZZ[t]")->isPrincipalIdealDomain());
  EXPECT_FALSE(ringFromString("QQ[x, y]")->isPrincipalIdealDomain());

  mpz_class order;
  EXPECT_FALSE(qqx->baseRingOrder(order));
  EXPECT_TRUE(ringFromString("GF(7)[x]")->baseRingOrder(order));
  EXPECT_EQ(7, order);
}

TEST(PolyRing, TermOrderAndDisplay) {
  const auto ring = ringFromString("QQ[x, y]");
  EXPECT_EQ("x^2 - 1/2*x*y + y + 3",
    elem(*ring, "y + x^2 - 1/2*x*y + 3").toString());
  EXPECT_EQ("-x + y", elem(*ring, "y - x").toString());
  EXPECT_EQ("0", elem(*ring, "x*y - y*x").toString());
  EXPECT_EQ("x*y^2 + x^2", elem(*ring, "x^2 + y^2*x").toString());
  EXPECT_EQ("x^2 - y^2", elem(*ring, "(x + y)*(x - y)").toString());

  const auto gf = ringFromString("GF(7)[x]");
  EXPECT_EQ("3*x", elem(*gf, "10*x").toString());
  EXPECT_EQ("5", elem(*gf, "1/3").toString());
  EXPECT_EQ("6*x + 1", elem(*gf, "1 - x").toString());
  EXPECT_EQ("0", elem(*gf, "7*x").toString());
}

TEST(PolyRing, IntegerCoefficients) {
  const auto zz = ringFromString("ZZ");
  EXPECT_THROW(zz->fromRational(mpq_class(1, 2)), CoercionError);
  EXPECT_EQ("2", zz->fromRational(mpq_class(4, 2)).toString());
  EXPECT_THROW(elem(*zz, "1/2"), CoercionError);
  EXPECT_TRUE(zz->isUnit(elem(*zz, "-1")));
  EXPECT_FALSE(zz->isUnit(elem(*zz, "2")));
  EXPECT_TRUE(elem(*ringFromString("QQ"), "2").isUnit());
}

TEST(PolyRing, Divides) {
  const auto zz = ringFromString("ZZ");
  EXPECT_TRUE(elem(*zz, "4").divides(elem(*zz, "12")));
  EXPECT_FALSE(elem(*zz, "4").divides(elem(*zz, "6")));
  EXPECT_TRUE(elem(*zz, "0").divides(elem(*zz, "0")));
  EXPECT_FALSE(elem(*zz, "0").divides(elem(*zz, "3")));
  EXPECT_TRUE(elem(*zz, "3").divides(elem(*zz, "0")));

  const auto zzt = ringFromString("ZZ[t]");
  EXPECT_TRUE(elem(*zzt, "2*t").divides(elem(*zzt, "4*t^2")));
  EXPECT_FALSE(elem(*zzt, "2*t").divides(elem(*zzt, "t^2")));

  const auto qqxy = ringFromString("QQ[x, y]");
  EXPECT_TRUE(elem(*qqxy, "x").divides(elem(*qqxy, "x*y")));
  EXPECT_TRUE(elem(*qqxy, "x + y").divides(elem(*qqxy, "x^2 - y^2")));
  EXPECT_FALSE(elem(*qqxy, "x + y").divides(elem(*qqxy, "x^2 + y^2")));
  EXPECT_TRUE(elem(*qqxy, "2*x").divides(elem(*qqxy, "x")));
}

TEST(PolyRing, Gcd) {
  const auto zz = ringFromString("ZZ");
  EXPECT_EQ(elem(*zz, "2"), elem(*zz, "-4").gcd(elem(*zz, "6")));
  EXPECT_EQ(elem(*zz, "5"), elem(*zz, "0").gcd(elem(*zz, "-5")));

  const auto qq = ringFromString("QQ");
  EXPECT_EQ(elem(*qq, "0"), elem(*qq, "0").gcd(elem(*qq, "0")));
  EXPECT_EQ(elem(*qq, "1"), elem(*qq, "3").gcd(elem(*qq, "0")));

  const auto qqx = ringFromString("QQ[x]");
  EXPECT_EQ("x + 1",
    elem(*qqx, "x^2 - 1").gcd(elem(*qqx, "x^2 + 2*x + 1")).toString());
  EXPECT_EQ("x - 1/2", elem(*qqx, "2*x - 1").gcd(elem(*qqx, "0")).toString());

  const auto qqxy = ringFromString("QQ[x, y]");
  EXPECT_THROW(elem(*qqxy, "x").gcd(elem(*qqxy, "y")),
    NotImplementedCapability);
  const auto zzt = ringFromString("ZZ[t]");
  EXPECT_THROW(elem(*zzt, "t").gcd(elem(*zzt, "2")),
    NotImplementedCapability);
}

TEST(PolyRing, QuoRem) {
  const auto zz = ringFromString("ZZ");
  auto qr = elem(*zz, "10").quoRem(elem(*zz, "8"));
  EXPECT_EQ(elem(*zz, "1"), qr.first);
  EXPECT_EQ(elem(*zz, "2"), qr.second);

  qr = elem(*zz, "-7").quoRem(elem(*zz, "2"));
  EXPECT_EQ(elem(*zz, "-4"), qr.first);
  EXPECT_EQ(elem(*zz, "1"), qr.second);

  qr = elem(*zz, "7").quoRem(elem(*zz, "-2"));
  EXPECT_EQ(elem(*zz, "-4"), qr.first);
  EXPECT_EQ(elem(*zz, "-1"), qr.second);

  EXPECT_THROW(elem(*zz, "7").quoRem(elem(*zz, "0")), DomainError);

  const auto qqx = ringFromString("QQ[x]");
  qr = elem(*qqx, "x^2 + 1").quoRem(elem(*qqx, "x - 1"));
  EXPECT_EQ("x + 1", qr.first.toString());
  EXPECT_EQ("2", qr.second.toString());

  const auto qqxy = ringFromString("QQ[x, y]");
  qr = elem(*qqxy, "x^2*y + y^2").quoRem(elem(*qqxy, "x*y - 1"));
  EXPECT_EQ("x", qr.first.toString());
  EXPECT_EQ("y^2 + x", qr.second.toString());

  const auto zzt = ringFromString("ZZ[t]");
  EXPECT_THROW(elem(*zzt, "t^2").quoRem(elem(*zzt, "t")),
    NotImplementedCapability);
}

TEST(PolyRing, Coercion) {
  const auto zz = ringFromString("ZZ");
  const auto qq = ringFromString("QQ");
  const auto qqx = ringFromString("QQ[x]");
  const auto qqxy = ringFromString("QQ[x, y]");
  const auto gf = ringFromString("GF(7)");

  EXPECT_TRUE(qqxy->canCoerceFrom(*zz));
  EXPECT_TRUE(qqxy->canCoerceFrom(*qqx));
  EXPECT_FALSE(qqx->canCoerceFrom(*qqxy));
  EXPECT_FALSE(zz->canCoerceFrom(*qq));
  EXPECT_FALSE(qq->canCoerceFrom(*gf));
  EXPECT_TRUE(gf->canCoerceFrom(*zz));

  EXPECT_EQ("3", qqx->coerce(elem(*zz, "3")).toString());
  EXPECT_EQ(qqx.get(), &qqx->coerce(elem(*zz, "3")).ring());
  EXPECT_EQ("x", qqxy->coerce(elem(*qqx, "x")).toString());
  EXPECT_EQ("2", zz->coerce(elem(*qq, "4/2")).toString());
  EXPECT_EQ("2", qqx->coerce(elem(*qqxy, "2")).toString());
  EXPECT_EQ("3", gf->coerce(elem(*zz, "10")).toString());
  EXPECT_EQ("4", gf->coerce(elem(*qq, "1/2")).toString());

  EXPECT_THROW(zz->coerce(elem(*qq, "1/2")), CoercionError);
  EXPECT_THROW(qqx->coerce(elem(*qqxy, "y")), CoercionError);
  EXPECT_THROW(qq->coerce(elem(*gf, "1")), CoercionError);
  EXPECT_THROW(gf->coerce(elem(*qq, "1/7")), CoercionError);
  EXPECT_THROW(zz->coerce(Element()), CoercionError);
}

TEST(PolyRing, MixedArithmetic) {
  const auto zz = ringFromString("ZZ");
  const auto qq = ringFromString("QQ");
  const auto qqx = ringFromString("QQ[x]");
  const auto gf = ringFromString("GF(7)");

  const auto sum = elem(*zz, "2") + elem(*qqx, "x");
  EXPECT_EQ(qqx.get(), &sum.ring());
  EXPECT_EQ("x + 2", sum.toString());
  EXPECT_EQ("2*x", (elem(*qqx, "x") * elem(*zz, "2")).toString());
  EXPECT_EQ("x^3", elem(*qqx, "x").pow(3).toString());
  EXPECT_EQ("1", elem(*qqx, "x").pow(0).toString());

  EXPECT_THROW(elem(*gf, "2") + elem(*qq, "1/2"), CoercionError);
  EXPECT_THROW(Element() + elem(*zz, "1"), TypeError);

  EXPECT_TRUE(elem(*zz, "2") == elem(*qq, "2"));
  EXPECT_FALSE(elem(*gf, "1") == elem(*qq, "1"));
  EXPECT_TRUE(Element() == Element());
  EXPECT_FALSE(Element() == elem(*zz, "0"));
}

TEST(PolyRing, CommonParent) {
  const auto zz = ringFromString("ZZ");
  const auto qq = ringFromString("QQ");
  const auto qqx = ringFromString("QQ[x]");
  const auto gf = ringFromString("GF(7)");

  std::vector<Element> elements;
  elements.push_back(elem(*zz, "2"));
  elements.push_back(elem(*qqx, "x"));
  EXPECT_EQ(qqx.get(), commonParent(elements));

  elements.push_back(elem(*qq, "1/2"));
  EXPECT_EQ(qqx.get(), commonParent(elements));

  elements.push_back(elem(*gf, "1"));
  EXPECT_EQ(nullptr, commonParent(elements));

  EXPECT_EQ(nullptr, commonParent(std::vector<Element>()));
}

TEST(PolyRing, Compare) {
  const auto zz = ringFromString("ZZ");
  EXPECT_EQ(LessThan, elem(*zz, "-5").compare(elem(*zz, "0")));
  EXPECT_EQ(GreaterThan, elem(*zz, "5").compare(elem(*zz, "3")));
  EXPECT_EQ(EqualTo, elem(*zz, "3").compare(elem(*zz, "3")));

  const auto qqxy = ringFromString("QQ[x, y]");
  EXPECT_EQ(GreaterThan, elem(*qqxy, "x^2").compare(elem(*qqxy, "x*y")));
  EXPECT_EQ(LessThan, elem(*qqxy, "y").compare(elem(*qqxy, "x")));
  EXPECT_EQ(LessThan, elem(*qqxy, "x").compare(elem(*qqxy, "x + 1")));
}

TEST(PolyRing, DegreeLimit) {
  const auto ring = ringFromString("QQ[x, y]");
  const auto x = ring->gen(0);
  const auto y = ring->gen(1);

  const auto big = x.pow(1UL << 30);
  EXPECT_EQ(1 << 30, big.poly().degree(0));
  EXPECT_THROW(big * big, DomainError);
  EXPECT_THROW(x.pow(1UL << 31), DomainError);

  const auto top = x.pow(2147483647UL);
  EXPECT_EQ(2147483647, top.poly().totalDegree());
  EXPECT_THROW(top * y, DomainError);
  EXPECT_TRUE(x.divides(top));

  const Exponent negative[] = {-1, 0};
  Poly poly(2);
  poly.append(1, negative);
  EXPECT_THROW(ring->makeElement(poly), DomainError);

  const Exponent tooLarge[] = {2147483647, 1};
  poly.setToZero();
  poly.append(1, tooLarge);
  EXPECT_THROW(ring->makeElement(poly), DomainError);
}
