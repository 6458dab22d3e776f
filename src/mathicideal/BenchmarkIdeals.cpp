// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "BenchmarkIdeals.hpp"

#include "IdealFactory.hpp"
#include "Ring.hpp"
#include "Errors.hpp"
#include "LogDomain.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

MATHICIDEAL_NAMESPACE_BEGIN

MATHICIDEAL_DEFINE_LOG_DOMAIN(
  BenchmarkIdeal,
  "Displays the calls to the backend that computes benchmark ideals "
  "and the time they take."
);

std::vector<Element> PolyBackend::evaluateNamedConstruction(
  const Ring& ring,
  const std::string& name,
  VarIndex varCount,
  bool homogeneous
) {
  MATHICIDEAL_ASSERT(varCount <= ring.varCount());
  std::vector<Element> gens;
  if (name == "cyclic")
    gens = cyclic(ring, varCount);
  else if (name == "katsura")
    gens = katsura(ring, varCount);
  else
    throw DomainError("Unknown benchmark ideal \"" + name + "\".");

  if (homogeneous && varCount > 0)
    for (auto it = gens.begin(); it != gens.end(); ++it)
      *it = homogenize(*it, varCount - 1);
  return gens;
}

std::vector<Element> PolyBackend::cyclic(const Ring& ring, VarIndex n) {
  std::vector<Element> gens;
  if (n == 0)
    return gens;
  for (VarIndex d = 1; d < n; ++d) {
    auto sum = ring.zero();
    for (VarIndex i = 0; i < n; ++i) {
      auto prod = ring.one();
      for (VarIndex k = 0; k < d; ++k)
        prod = ring.multiply(prod, ring.gen((i + k) % n));
      sum = ring.add(sum, prod);
    }
    gens.push_back(sum);
  }
  auto prod = ring.one();
  for (VarIndex i = 0; i < n; ++i)
    prod = ring.multiply(prod, ring.gen(i));
  gens.push_back(ring.subtract(prod, ring.one()));
  return gens;
}

std::vector<Element> PolyBackend::katsura(const Ring& ring, VarIndex n) {
  std::vector<Element> gens;
  if (n == 0)
    return gens;

  // x(i) is the variable x_|i|, which is zero for |i| >= n.
  const auto signedN = static_cast<long>(n);
  const auto x = [&](long i) {
    const auto index = i < 0 ? -i : i;
    return index < signedN ?
      ring.gen(static_cast<VarIndex>(index)) : ring.zero();
  };

  auto sum = ring.zero();
  for (long i = -(signedN - 1); i < signedN; ++i)
    sum = ring.add(sum, x(i));
  gens.push_back(ring.subtract(sum, ring.one()));

  for (long m = 0; m < signedN - 1; ++m) {
    auto row = ring.zero();
    for (long j = -(signedN - 1); j < signedN; ++j)
      row = ring.add(row, ring.multiply(x(j), x(m - j)));
    gens.push_back(ring.subtract(row, x(m)));
  }
  return gens;
}

Element PolyBackend::homogenize(const Element& f, VarIndex var) {
  const auto& ring = f.ring();
  MATHICIDEAL_ASSERT(var < ring.varCount());
  const auto& poly = f.poly();
  const auto degree = poly.totalDegree();

  Poly homogeneous(poly.varCount());
  homogeneous.reserve(poly.termCount());
  std::vector<Exponent> mono(poly.varCount());
  for (size_t term = 0; term < poly.termCount(); ++term) {
    const auto from = poly.mono(term);
    std::copy(from, from + poly.varCount(), mono.begin());
    mono[var] += degree - poly.degree(term);
    homogeneous.append(poly.coef(term), mono.data());
  }
  return ring.makeElement(std::move(homogeneous));
}

namespace {
  Ideal benchmarkIdeal(
    const char* name,
    const Ring& ring,
    IdealBackend& backend,
    VarIndex n,
    bool homogeneous
  ) {
    if (ring.varCount() == 0)
      throw DomainError("The " + std::string(name) + " ideal needs a ring "
        "with variables, not " + ring.name() + '.');
    if (n == 0)
      n = ring.varCount();
    if (n > ring.varCount()) {
      std::ostringstream err;
      err << "The " << name << " ideal in " << n << " variables needs a ring "
        "with at least that many variables, but " << ring.name() << " has "
        << ring.varCount() << '.';
      throw DomainError(err.str());
    }

    MATHICIDEAL_LOG_INCREMENT(BenchmarkIdeal);
    std::vector<Element> gens;
    {
      MATHICIDEAL_LOG_TIME(BenchmarkIdeal) << "Computing the "
        << (homogeneous ? "homogeneous " : "") << name << " ideal in "
        << n << " variables.\n";
      gens = backend.evaluateNamedConstruction(ring, name, n, homogeneous);
    }
    return makeIdeal(ring, std::move(gens));
  }
}

Ideal cyclicIdeal(
  const Ring& ring,
  IdealBackend& backend,
  VarIndex n,
  bool homogeneous
) {
  return benchmarkIdeal("cyclic", ring, backend, n, homogeneous);
}

Ideal katsuraIdeal(
  const Ring& ring,
  IdealBackend& backend,
  VarIndex n,
  bool homogeneous
) {
  return benchmarkIdeal("katsura", ring, backend, n, homogeneous);
}

Ideal fieldIdeal(const Ring& ring) {
  mpz_class order;
  if (!ring.baseRingOrder(order))
    throw DomainError("The field ideal needs a finite base ring, but " +
      ring.name() + " has an infinite one.");
  if (order > std::numeric_limits<Exponent>::max())
    throw DomainError("The base ring of " + ring.name() +
      " is too large to make its field ideal.");

  const auto q = order.get_ui();
  std::vector<Element> gens;
  gens.reserve(ring.varCount());
  for (VarIndex var = 0; var < ring.varCount(); ++var) {
    const auto x = ring.gen(var);
    gens.push_back(ring.subtract(x.pow(q), x));
  }
  return makeIdeal(ring, std::move(gens));
}

MATHICIDEAL_NAMESPACE_END
