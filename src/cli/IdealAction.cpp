// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "mathicideal/stdinc.h"
#include "IdealAction.hpp"

#include "mathicideal/IdealIO.hpp"
#include "mathicideal/Scanner.hpp"
#include "mathicideal/Errors.hpp"
#include <fstream>
#include <iostream>

MATHICIDEAL_NAMESPACE_BEGIN

namespace {
  /// Reads an element of ring from the text of a command line parameter.
  Element parseElement(const Ring& ring, const std::string& text) {
    Scanner in(text);
    const auto element = IdealIO().readElement(ring, in);
    in.expectEOF();
    return element;
  }

  const char* compareName(CompareResult result) {
    switch (result) {
    case LessThan: return "less than";
    case EqualTo: return "equal to";
    case GreaterThan: return "greater than";
    }
    MATHICIDEAL_UNREACHABLE;
  }
}

IdealAction::IdealAction():
  mParams(1, 2),

  mReduce("reduce",
    "Display the reduction of this element modulo the ideal.",
    ""),

  mContains("contains",
    "Display whether this element lies in the ideal.",
    ""),

  mOutput("output",
    "Write the ideal with normalized generators to the file X.out where X "
    "is the project name.",
    false)
{
  mParams.registerFileNameExtension(".ideal");
}

void IdealAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(std::move(tokens), parser);
}

void IdealAction::performAction() {
  mParams.perform();
  const std::string projectName = mParams.inputFileNameStem(0);

  // read input
  const std::string inputFileName = projectName + ".ideal";
  std::ifstream inputFile(inputFileName.c_str());
  if (inputFile.fail())
    mathic::reportError("Could not read input file \"" + inputFileName + "\"");

  IdealIO io;
  Scanner in(inputFile);
  const auto ring = io.readRing(in);
  const auto ideal = io.readIdeal(*ring, in);
  in.expectEOF();

  auto& out = std::cout;
  out << ideal << '\n'
    << "kind:       " << kindName(ideal.kind()) << '\n'
    << "principal:  " << ideal.isPrincipal() << '\n'
    << "trivial:    " << ideal.isTrivial() << '\n'
    << "prime:      " << ideal.isPrime() << '\n'
    << "maximal:    " << ideal.isMaximal() << '\n';

  if (!mReduce.value().empty()) {
    const auto f = parseElement(*ring, mReduce.value());
    out << "reduce(" << f << ") = " << ideal.reduce(f) << '\n';
  }
  if (!mContains.value().empty()) {
    const auto x = parseElement(*ring, mContains.value());
    out << "contains(" << x << "): " << ideal.contains(x) << '\n';
  }

  if (mParams.inputFileCount() == 2) {
    const std::string otherName = mParams.inputFileNameStem(1) + ".ideal";
    std::ifstream otherFile(otherName.c_str());
    if (otherFile.fail())
      mathic::reportError("Could not read input file \"" + otherName + "\"");
    Scanner otherIn(otherFile);
    const auto otherRing = io.readRing(otherIn);
    if (!otherRing->sameAs(*ring))
      mathic::reportError("The ideals of \"" + inputFileName + "\" and \"" +
        otherName + "\" are not in the same ring.");
    const auto other = io.readIdeal(*ring, otherIn);
    otherIn.expectEOF();

    out << "other:      " << other << '\n'
      << "sum:        ";
    try {
      const auto sum = ideal + other;
      out << sum << '\n';
    } catch (const NotImplementedCapability& e) {
      out << "not implemented (" << e.what() << ")\n";
    }
    out << "product:    " << ideal * other << '\n'
      << "comparison: " << compareName(ideal.compare(other)) << '\n';
  }

  if (mOutput.value()) {
    std::ofstream output((projectName + ".out").c_str());
    io.writeRing(*ring, output);
    output << '\n';
    io.writeIdeal(ideal, output);
  }
}

const char* IdealAction::staticName() {
  return "ideal";
}

const char* IdealAction::name() const {
  return staticName();
}

const char* IdealAction::description() const {
  return "Reads the ideal in the file X.ideal where X is the project name "
    "and displays its kind and what can be decided about it. The file "
    "contains a ring such as QQ[x, y] followed by the number of generators "
    "and the generators separated by commas. With a second project name, "
    "the second ideal is read in the same ring and the sum, product and "
    "comparison of the two ideals are displayed.";
}

const char* IdealAction::shortDescription() const {
  return "Display information about an ideal.";
}

void IdealAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
  parameters.push_back(&mReduce);
  parameters.push_back(&mContains);
  parameters.push_back(&mOutput);
}

MATHICIDEAL_NAMESPACE_END
