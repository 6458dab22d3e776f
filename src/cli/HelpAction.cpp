// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "mathicideal/stdinc.h"
#include "HelpAction.hpp"

#include "mathicideal/LogDomain.hpp"
#include "mathicideal/LogDomainSet.hpp"
#include <iostream>

MATHICIDEAL_NAMESPACE_BEGIN

void HelpAction::performAction() {
  if (topic() != "logs") {
    mathic::HelpAction::performAction();
    return;
  }

  const char* header =
    "mideal offers a set of logs that can be enabled or disabled "
    "individually.\n"
    "\n"
    "A log has a streaming component and a summary component. The "
    "streaming component is printed as the logged event occurs, such as "
    "the kind chosen for an ideal as it is made. The summary is printed "
    "when the program ends and reports how many events there were and how "
    "long they took.\n"
    "\n"
    "You specify the log configuration using the option -logs X, where X is "
    "a comma-separated list of log specifications. Here is an example:\n"
    "\n"
    "    A,+B,-C,D+,E-\n"
    "\n"
    "This enables logs A, B, D and E and disables C. Furthermore, streaming "
    "for D is turned on while it is turned off for E. The streaming setting "
    "for A, B and C is the default for those logs.\n"
    "\n"
    "A prefix of - disables the log while no prefix or a prefix of + enables "
    "it. A suffix of - turns off streaming while a suffix of + turns it on. "
    "If there is no suffix then the setting for streaming is unchanged. A "
    "prefix or suffix of 0 means do nothing. The name all stands for every "
    "log and none for no log, so 0all- turns off all streaming.\n"
    "\n"
    "The following is a list of all compile-time enabled logs. The prefixes "
    "and suffixes indicate the default state of the log.\n";
  mathic::display(header);
  const auto& logs = LogDomainSet::singleton().logDomains();
  for (auto it = logs.begin(); it != logs.end(); ++it) {
    const auto toSign = [](const bool b) {return b ? '+' : '-';};
    std::cerr
      << "\n "
      << toSign((*it)->enabled())
      << (*it)->name()
      << toSign((*it)->streamEnabledPure())
      << '\n';
    mathic::display((*it)->description(), "   ");
  }
}

MATHICIDEAL_NAMESPACE_END
