// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "mathicideal/stdinc.h"
#include "BenchAction.hpp"

#include "mathicideal/BenchmarkIdeals.hpp"
#include "mathicideal/IdealIO.hpp"
#include "mathicideal/Scanner.hpp"
#include <iostream>

MATHICIDEAL_NAMESPACE_BEGIN

BenchAction::BenchAction():
  mParams(1, 1),

  mRing("ring",
    "The ring of the benchmark ideal, such as GF(32003)[a, b, c, d].",
    "QQ[x0, x1, x2]"),

  mVarCount("n",
    "Use the first n variables of the ring. A value of 0 means all of them. "
    "Does not apply to the field ideal.",
    0),

  mHomogeneous("homogeneous",
    "Homogenize the generators with the last of the variables used. Does "
    "not apply to the field ideal.",
    false)
{}

void BenchAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(std::move(tokens), parser);
}

void BenchAction::performAction() {
  mParams.perform();
  const auto which = mParams.inputFileName(0);

  IdealIO io;
  Scanner in(mRing.value());
  const auto ring = io.readRing(in);
  in.expectEOF();

  const auto n = static_cast<VarIndex>(mVarCount.value());
  const auto homogeneous = mHomogeneous.value();
  PolyBackend backend;
  std::unique_ptr<Ideal> ideal;
  if (which == "cyclic")
    ideal = make_unique<Ideal>(cyclicIdeal(*ring, backend, n, homogeneous));
  else if (which == "katsura")
    ideal = make_unique<Ideal>(katsuraIdeal(*ring, backend, n, homogeneous));
  else if (which == "field")
    ideal = make_unique<Ideal>(fieldIdeal(*ring));
  else {
    mathic::reportError("Unknown benchmark ideal \"" + which +
      "\". The choices are cyclic, katsura and field.");
    return;
  }

  io.writeRing(*ring, std::cout);
  std::cout << '\n';
  io.writeIdeal(*ideal, std::cout);
}

const char* BenchAction::staticName() {
  return "bench";
}

const char* BenchAction::name() const {
  return staticName();
}

const char* BenchAction::description() const {
  return "Writes a benchmark ideal to standard output. The direct parameter "
    "names the ideal: cyclic for the cyclic n-roots ideal, katsura for the "
    "Katsura ideal or field for the ideal generated by x^q - x for each "
    "variable x where q is the size of the finite base ring.";
}

const char* BenchAction::shortDescription() const {
  return "Write a benchmark ideal.";
}

void BenchAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
  parameters.push_back(&mRing);
  parameters.push_back(&mVarCount);
  parameters.push_back(&mHomogeneous);
}

MATHICIDEAL_NAMESPACE_END
