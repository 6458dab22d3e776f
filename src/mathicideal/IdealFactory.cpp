// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "IdealFactory.hpp"

#include "GeneratorNormalizer.hpp"
#include "Ring.hpp"
#include "Errors.hpp"
#include "LogDomain.hpp"

MATHICIDEAL_NAMESPACE_BEGIN

MATHICIDEAL_DEFINE_LOG_DOMAIN(
  IdealConstruct,
  "Displays the kind chosen for each ideal that is made and why."
);

IdealRequest::IdealRequest(
  Shape shape,
  const Ring* ring,
  std::vector<Element> gens
):
  mShape(shape),
  mRing(ring),
  mGens(std::move(gens)),
  mCoerce(true)
{}

IdealRequest IdealRequest::invalid(std::string reason) {
  IdealRequest request(Invalid, nullptr, std::vector<Element>());
  request.mInvalidReason = std::move(reason);
  return request;
}

IdealRequest IdealRequest::ringAndGens(
  const Ring& ring,
  std::vector<Element> gens,
  bool coerce
) {
  IdealRequest request(RingAndGens, &ring, std::move(gens));
  request.mCoerce = coerce;
  return request;
}

IdealRequest IdealRequest::elementList(std::vector<Element> elements) {
  if (elements.empty())
    return invalid("Cannot make an ideal from an empty list of elements "
      "without a ring.");
  for (auto it = elements.begin(); it != elements.end(); ++it)
    if (!it->hasRing())
      return invalid("Cannot make an ideal from a value without a ring.");
  return IdealRequest(ElementList, nullptr, std::move(elements));
}

IdealRequest IdealRequest::singleElement(const Element& element) {
  if (!element.hasRing())
    return invalid("Cannot make an ideal from a value without a ring.");
  return IdealRequest(SingleElement, nullptr, std::vector<Element>(1, element));
}

IdealRequest IdealRequest::fromIdeal(const Ideal& ideal) {
  return IdealRequest(FromIdeal, &ideal.ring(), ideal.gens());
}

namespace {
  /// Steps 4 to 8 of makeIdeal. Replaces gens by the generators of the
  /// ideal and returns its kind.
  Ideal::Kind classify(
    const Ring& ring,
    std::vector<Element>& gens,
    bool coerce
  ) {
    if (!ring.isCommutative())
      throw TypeError("Ideals are only supported over commutative rings, "
        "not over " + ring.name() + '.');

    gens = normalizeGenerators(ring, std::move(gens), coerce);
    MATHICIDEAL_ASSERT(!gens.empty());

    if (ring.isPrincipalIdealDomain()) {
      auto g = gens.front();
      if (gens.size() == 1) {
        // gcd(g, g) puts g in a canonical form such as making it positive.
        try {
          g = ring.gcd(g, g);
        } catch (const NotImplementedCapability&) {
          MATHICIDEAL_LOG(IdealConstruct) << "No gcd in " << ring.name()
            << ", so the generator " << g << " is kept as it is.\n";
        }
      } else {
        for (auto it = gens.begin() + 1; it != gens.end(); ++it)
          g = ring.gcd(g, *it);
      }
      MATHICIDEAL_LOG(IdealConstruct) << gens.size()
        << " generator(s) reduced to gcd " << g << " since "
        << ring.name() << " is a principal ideal domain.\n";
      gens.assign(1, g);
      return Ideal::Pid;
    }

    const auto kind = gens.size() == 1 ? Ideal::Principal : Ideal::Generic;
    MATHICIDEAL_LOG(IdealConstruct) << kindName(kind) << " ideal with "
      << gens.size() << " generator(s) in " << ring.name() << ".\n";
    return kind;
  }
}

Ideal makeIdeal(const IdealRequest& request) {
  MATHICIDEAL_LOG_INCREMENT(IdealConstruct);
  const Ring* ring = nullptr;
  bool coerce = true;
  switch (request.shape()) {
  case IdealRequest::FromIdeal:
  case IdealRequest::RingAndGens:
    MATHICIDEAL_ASSERT(request.ring() != nullptr);
    ring = request.ring();
    coerce = request.coerce();
    break;

  case IdealRequest::ElementList:
    ring = commonParent(request.gens());
    if (ring == nullptr) {
      std::string msg = "No common ring for the elements";
      for (auto it = request.gens().begin(); it != request.gens().end(); ++it)
        msg += (it == request.gens().begin() ? " " : ", ") + it->toString();
      throw TypeError(msg + '.');
    }
    break;

  case IdealRequest::SingleElement:
    MATHICIDEAL_ASSERT(request.gens().size() == 1);
    ring = &request.gens().front().ring();
    break;

  case IdealRequest::Invalid:
    throw TypeError(request.invalidReason());
  }
  MATHICIDEAL_ASSERT(ring != nullptr);

  auto gens = request.gens();
  const auto kind = classify(*ring, gens, coerce);
  return Ideal(*ring, kind, std::move(gens));
}

Ideal makeIdeal(const Ring& ring, std::vector<Element> gens, bool coerce) {
  return makeIdeal(IdealRequest::ringAndGens(ring, std::move(gens), coerce));
}

Ideal makeIdeal(const Ring& ring, const Element& element) {
  return makeIdeal(ring, std::vector<Element>(1, element));
}

Ideal makeIdeal(const Ring& ring, const Ideal& ideal) {
  return makeIdeal(ring, ideal.gens());
}

Ideal makeIdeal(const Ideal& ideal) {
  return makeIdeal(IdealRequest::fromIdeal(ideal));
}

Ideal makeIdeal(std::vector<Element> elements) {
  return makeIdeal(IdealRequest::elementList(std::move(elements)));
}

Ideal makeIdeal(const Element& element) {
  return makeIdeal(IdealRequest::singleElement(element));
}

Ideal makeFractionalIdeal(
  const Ring& ring,
  std::vector<Element> gens,
  bool coerce
) {
  MATHICIDEAL_LOG_INCREMENT(IdealConstruct);
  auto normalized = normalizeGenerators(ring, std::move(gens), coerce);
  MATHICIDEAL_LOG(IdealConstruct) << "Fractional ideal with "
    << normalized.size() << " generator(s) in " << ring.name() << ".\n";
  return Ideal(ring, Ideal::Fractional, std::move(normalized));
}

MATHICIDEAL_NAMESPACE_END
