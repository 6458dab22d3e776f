// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "mathicideal/stdinc.h"

#include "IdealAction.hpp"
#include "BenchAction.hpp"
#include "HelpAction.hpp"
#include "mathicideal/LogDomainSet.hpp"
#include <mathic.h>
#include <iostream>
#include <exception>

int main(int argc, char **argv) {
  try {
    mathic::CliParser parser;
    parser.registerAction<mid::IdealAction>();
    parser.registerAction<mid::BenchAction>();
    parser.registerAction<mid::HelpAction>();

    std::vector<std::string> commandLine(argv, argv + argc);
    commandLine.erase(commandLine.begin());

    parser.parse(commandLine)->performAction();
  } catch (const mathic::MathicException& e) {
    mathic::display(e.what());
    return -1;
  } catch (const std::exception& e) {
    mathic::display(e.what());
    return -1;
  }

  mid::LogDomainSet::singleton().printReport(std::cerr);
  return 0;
}
