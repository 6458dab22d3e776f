// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "mathicideal/stdinc.h"

#include "mathicideal/BenchmarkIdeals.hpp"
#include "mathicideal/Errors.hpp"
#include "testHelpers.hpp"
#include <gtest/gtest.h>

using namespace mid;

namespace {
  /// Remembers the arguments of each call and returns the variables.
  class RecordingBackend : public IdealBackend {
  public:
    RecordingBackend(): callCount(0), lastVarCount(0), lastHomogeneous(false) {}

    virtual std::vector<Element> evaluateNamedConstruction(
      const Ring& ring,
      const std::string& name,
      VarIndex varCount,
      bool homogeneous
    ) {
      ++callCount;
      lastName = name;
      lastVarCount = varCount;
      lastHomogeneous = homogeneous;
      auto gens = ring.gens();
      gens.resize(varCount);
      return gens;
    }

    size_t callCount;
    std::string lastName;
    VarIndex lastVarCount;
    bool lastHomogeneous;
  };

  std::vector<std::string> split(const std::string& str) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (true) {
      const auto end = str.find("; ", begin);
      parts.push_back(str.substr(begin, end - begin));
      if (end == std::string::npos)
        return parts;
      begin = end + 2;
    }
  }
}

TEST(BenchmarkIdeals, Cyclic) {
  const auto ring = ringFromString("QQ[a, b, c]");
  PolyBackend backend;
  const auto ideal = cyclicIdeal(*ring, backend);
  EXPECT_EQ(Ideal::Generic, ideal.kind());
  EXPECT_EQ(split("a + b + c; a*b + a*c + b*c; a*b*c - 1"), genStrings(ideal));

  EXPECT_EQ(split("a + b; a*b - 1"),
    genStrings(cyclicIdeal(*ring, backend, 2)));

  const auto homogeneous = cyclicIdeal(*ring, backend, 0, true);
  EXPECT_EQ(split("a + b + c; a*b + a*c + b*c; a*b*c - c^3"),
    genStrings(homogeneous));
}

TEST(BenchmarkIdeals, Katsura) {
  const auto ring = ringFromString("QQ[a, b, c]");
  PolyBackend backend;
  const auto ideal = katsuraIdeal(*ring, backend);
  EXPECT_EQ(split(
    "a + 2*b + 2*c - 1; a^2 + 2*b^2 + 2*c^2 - a; 2*a*b + 2*b*c - b"),
    genStrings(ideal));

  const auto homogeneous = katsuraIdeal(*ring, backend, 3, true);
  EXPECT_EQ("a + 2*b + c", homogeneous.gens().front().toString());
}

TEST(BenchmarkIdeals, Homogenize) {
  const auto ring = ringFromString("QQ[x, y]");
  EXPECT_EQ("x^2 + x*y + y^2",
    PolyBackend::homogenize(elem(*ring, "x^2 + x + 1"), 1).toString());
  EXPECT_EQ("x*y",
    PolyBackend::homogenize(elem(*ring, "x*y"), 0).toString());
}

TEST(BenchmarkIdeals, Backend) {
  const auto ring = ringFromString("GF(101)[x, y, z]");
  RecordingBackend backend;

  const auto all = cyclicIdeal(*ring, backend);
  EXPECT_EQ(1u, backend.callCount);
  EXPECT_EQ("cyclic", backend.lastName);
  EXPECT_EQ(3u, backend.lastVarCount);
  EXPECT_FALSE(backend.lastHomogeneous);
  EXPECT_EQ(split("x; y; z"), genStrings(all));

  const auto two = katsuraIdeal(*ring, backend, 2, true);
  EXPECT_EQ(2u, backend.callCount);
  EXPECT_EQ("katsura", backend.lastName);
  EXPECT_EQ(2u, backend.lastVarCount);
  EXPECT_TRUE(backend.lastHomogeneous);
  EXPECT_EQ(split("x; y"), genStrings(two));
}

TEST(BenchmarkIdeals, Errors) {
  PolyBackend backend;
  const auto qq = ringFromString("QQ");
  EXPECT_THROW(cyclicIdeal(*qq, backend), DomainError);

  const auto ring = ringFromString("QQ[a, b, c]");
  EXPECT_THROW(katsuraIdeal(*ring, backend, 4), DomainError);
  EXPECT_THROW(backend.evaluateNamedConstruction(*ring, "noon", 3, false),
    DomainError);

  RecordingBackend recording;
  EXPECT_THROW(cyclicIdeal(*qq, recording), DomainError);
  EXPECT_EQ(0u, recording.callCount);
}

TEST(BenchmarkIdeals, FieldIdeal) {
  const auto gf3 = ringFromString("GF(3)[x, y]");
  const auto ideal = fieldIdeal(*gf3);
  EXPECT_EQ(Ideal::Generic, ideal.kind());
  EXPECT_EQ(split("x^3 + 2*x; y^3 + 2*y"), genStrings(ideal));

  const auto gf2 = ringFromString("GF(2)[x]");
  const auto pid = fieldIdeal(*gf2);
  EXPECT_EQ(Ideal::Pid, pid.kind());
  EXPECT_EQ("x^2 + x", pid.gen().toString());

  EXPECT_THROW(fieldIdeal(*ringFromString("QQ[x]")), DomainError);
  EXPECT_THROW(fieldIdeal(*ringFromString("GF(2147483659)[x]")), DomainError);
}
