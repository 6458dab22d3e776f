// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "mathicideal/stdinc.h"

#include "mathicideal/IdealIO.hpp"
#include "mathicideal/Errors.hpp"
#include "testHelpers.hpp"
#include <mathic.h>
#include <gtest/gtest.h>
#include <sstream>

using namespace mid;

namespace {
  std::string writeRingString(const PolyRing& ring) {
    std::ostringstream out;
    IdealIO().writeRing(ring, out);
    return out.str();
  }

  std::string writeIdealString(const Ideal& ideal) {
    std::ostringstream out;
    IdealIO().writeIdeal(ideal, out);
    return out.str();
  }

  Ideal readIdealString(const Ring& ring, const std::string& str) {
    Scanner in(str);
    auto ideal = IdealIO().readIdeal(ring, in);
    in.expectEOF();
    return ideal;
  }
}

TEST(IdealIO, Rings) {
  EXPECT_EQ("GF(7)[x, y]", writeRingString(*ringFromString("GF(7)[x,y]")));
  EXPECT_EQ("ZZ[t]", writeRingString(*ringFromString("  ZZ [ t ] ")));
  EXPECT_EQ("QQ", writeRingString(*ringFromString("QQ[]")));
  EXPECT_EQ(0u, ringFromString("QQ[]")->varCount());

  std::ostringstream out;
  IdealIO().writeBaseRing(BaseRing::primeField(101), out);
  EXPECT_EQ("GF(101)", out.str());
}

TEST(IdealIO, RingErrors) {
  EXPECT_THROW(ringFromString("RR"), mathic::MathicException);
  EXPECT_THROW(ringFromString("QQ[x"), mathic::MathicException);
  EXPECT_THROW(ringFromString("QQ[x,]"), mathic::MathicException);
  EXPECT_THROW(ringFromString("GF(p)"), mathic::MathicException);
  EXPECT_THROW(ringFromString("QQ x"), mathic::MathicException);
  EXPECT_THROW(ringFromString("GF(6)"), DomainError);
  EXPECT_THROW(ringFromString("QQ[x, x]"), DomainError);
}

TEST(IdealIO, Elements) {
  const auto ring = ringFromString("QQ[x, y]");
  EXPECT_EQ("-x^2 + 2*x*y - y^2", elem(*ring, "-(x - y)^2").toString());
  EXPECT_EQ("8*x", elem(*ring, "2^3*x").toString());
  EXPECT_EQ("2*x^2*y - x^2 + 1",
    elem(*ring, "2*x^2*y - (x + 1)*(x - 1)").toString());
  EXPECT_EQ("x + 1", elem(*ring, "+x + 1").toString());

  std::ostringstream out;
  IdealIO().writeElement(elem(*ring, "y + x^2 - 1/2*x*y + 3"), out);
  EXPECT_EQ("x^2 - 1/2*x*y + y + 3", out.str());
}

TEST(IdealIO, ElementErrors) {
  const auto ring = ringFromString("QQ[x, y]");
  EXPECT_THROW(elem(*ring, "z"), mathic::MathicException);
  EXPECT_THROW(elem(*ring, "1/0"), mathic::MathicException);
  EXPECT_THROW(elem(*ring, "x +"), mathic::MathicException);
  EXPECT_THROW(elem(*ring, "(x"), mathic::MathicException);
  EXPECT_THROW(elem(*ring, "x y"), mathic::MathicException);

  const auto zz = ringFromString("ZZ");
  EXPECT_THROW(elem(*zz, "1/2"), CoercionError);
  EXPECT_EQ("3", elem(*zz, "6/2").toString());

  EXPECT_EQ("x^2147483647", elem(*ring, "x^2147483647").toString());
  EXPECT_THROW(elem(*ring, "x^3000000000"), mathic::MathicException);
  EXPECT_THROW(elem(*ring, "x^2147483647*y"), DomainError);
  EXPECT_THROW(elem(*ring, "(x*y)^1073741824"), DomainError);
}

TEST(IdealIO, Ideals) {
  const auto ring = ringFromString("QQ[x, y]");
  const auto ideal = readIdealString(*ring, "2\nx^2 - 1/2*y, x*y\n");
  EXPECT_EQ(Ideal::Generic, ideal.kind());
  ASSERT_EQ(2u, ideal.genCount());
  EXPECT_EQ("x^2 - 1/2*y", ideal.gens()[0].toString());
  EXPECT_EQ("x*y", ideal.gens()[1].toString());

  const auto fractional = readIdealString(*ring, "fractional 2 x, 1/2");
  EXPECT_EQ(Ideal::Fractional, fractional.kind());

  const auto zero = readIdealString(*ring, "0");
  EXPECT_TRUE(zero.isZero());

  EXPECT_THROW(readIdealString(*ring, "ideal 1 x"), mathic::MathicException);
  EXPECT_THROW(readIdealString(*ring, "2 x"), mathic::MathicException);
  EXPECT_THROW(readIdealString(*ring, "1 x, y"), mathic::MathicException);
}

TEST(IdealIO, WriteIdeal) {
  const auto ring = ringFromString("QQ[x, y]");
  const auto ideal = makeIdeal(*ring, elems(*ring, "x, y"));
  EXPECT_EQ("2\nx, y\n", writeIdealString(ideal));
  EXPECT_EQ(ideal, readIdealString(*ring, writeIdealString(ideal)));

  const auto fractional = makeFractionalIdeal(*ring, elems(*ring, "x, 1/2"));
  EXPECT_EQ("fractional 2\nx, 1/2\n", writeIdealString(fractional));
  const auto readBack =
    readIdealString(*ring, writeIdealString(fractional));
  EXPECT_EQ(Ideal::Fractional, readBack.kind());
  EXPECT_EQ(fractional, readBack);
}

TEST(IdealIO, RingAndIdealRoundTrip) {
  // The ring is read back as a new object, as when reading an output file.
  const auto check = [](const PolyRing& ring, const Ideal& ideal) {
    std::ostringstream out;
    IdealIO io;
    io.writeRing(ring, out);
    out << '\n';
    io.writeIdeal(ideal, out);

    Scanner in(out.str());
    const auto ringBack = io.readRing(in);
    const auto idealBack = io.readIdeal(*ringBack, in);
    in.expectEOF();
    EXPECT_TRUE(ringBack->sameAs(ring));
    EXPECT_EQ(ideal.kind(), idealBack.kind());
    EXPECT_EQ(genStrings(ideal), genStrings(idealBack));
    EXPECT_EQ(ideal, idealBack);
  };

  const auto gf = ringFromString("GF(5)[x]");
  const auto pid = makeIdeal(*gf, elems(*gf, "x^2 - 1, 2*x + 2"));
  EXPECT_EQ(Ideal::Pid, pid.kind());
  EXPECT_EQ("GF(5)[x]\n1\nx + 1\n",
    writeRingString(*gf) + '\n' + writeIdealString(pid));
  check(*gf, pid);

  const auto zz = ringFromString("ZZ");
  const auto integers = makeIdeal(*zz, elems(*zz, "-12, 18"));
  EXPECT_EQ("1\n6\n", writeIdealString(integers));
  check(*zz, integers);

  const auto zzt = ringFromString("ZZ[t]");
  const auto principal = makeIdeal(*zzt, elem(*zzt, "2*t^2 - 3"));
  EXPECT_EQ(Ideal::Principal, principal.kind());
  check(*zzt, principal);

  const auto qqxy = ringFromString("QQ[x, y]");
  check(*qqxy, makeIdeal(*qqxy, elems(*qqxy, "x^2 - 1/2*y, x*y")));
  check(*qqxy, makeFractionalIdeal(*qqxy, elems(*qqxy, "x, 1/3")));
}

TEST(IdealIO, Stream) {
  std::istringstream in("GF(5)[x]\n1\n3*x^2 + 3");
  Scanner scanner(in);
  IdealIO io;
  const auto ring = io.readRing(scanner);
  const auto ideal = io.readIdeal(*ring, scanner);
  scanner.expectEOF();
  EXPECT_EQ(Ideal::Pid, ideal.kind());
  EXPECT_EQ("x^2 + 1", ideal.gen().toString());
  EXPECT_EQ(3u, scanner.lineCount());
}

TEST(IdealIO, ErrorLine) {
  const auto ring = ringFromString("QQ[x]");
  try {
    readIdealString(*ring, "1\n\nz");
    FAIL() << "Expected a syntax error.";
  } catch (const mathic::MathicException& e) {
    EXPECT_NE(std::string::npos, std::string(e.what()).find("line 3"));
  }
}
