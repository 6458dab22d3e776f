// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "LogDomainSet.hpp"

#include <mathic.h>
#include <algorithm>
#include <cstring>

MATHICIDEAL_NAMESPACE_BEGIN

LogDomainSet::LogDomainSet():
  mStartTime(tbb::tick_count::now()) {
}

void LogDomainSet::registerLogDomain(LogDomain<true>& domain) {
  mLogDomains.push_back(&domain);
}

LogDomain<true>* LogDomainSet::logDomain(const char* const name) {
  const auto func = [&](const LogDomain<true>* const ld){
    return std::strcmp(ld->name(), name) == 0;
  };
  const auto it = std::find_if(mLogDomains.begin(), mLogDomains.end(), func);
  return it == mLogDomains.end() ? static_cast<LogDomain<true>*>(nullptr) : *it;
}

void LogDomainSet::performLogCommands(const std::string& cmds) {
  if (cmds.empty())
    return;
  size_t offset = 0;
  while (offset < cmds.size()) {
    const auto next = cmds.find(',', offset);
    const auto end = next == std::string::npos ? cmds.size() : next;
    if (end != offset)
      performLogCommand(cmds.substr(offset, end - offset));
    offset = end + 1;
  }
}

void LogDomainSet::performLogCommand(std::string cmd) {
  if (cmd.empty())
    mathic::reportError("Empty log command.");

  // The values are -1 for off, 0 for as-is and 1 for on.
  const auto sign = [](const char c) {
    return c == '+' ? 1 : c == '-' ? -1 : 0;
  };
  int enable = 1;
  int stream = 0;
  const char first = cmd.front();
  if (first == '+' || first == '-' || first == '0') {
    enable = sign(first);
    cmd.erase(0, 1);
  }
  if (!cmd.empty()) {
    const char last = cmd.back();
    if (last == '+' || last == '-' || last == '0') {
      stream = sign(last);
      cmd.erase(cmd.size() - 1);
    }
  }
  if (cmd.empty())
    mathic::reportError("Log command names no log.");

  const auto apply = [&](LogDomain<true>& log) {
    if (enable != 0)
      log.setEnabled(enable > 0);
    if (stream != 0)
      log.setStreamEnabled(stream > 0);
  };

  if (cmd == "none")
    return;
  if (cmd == "all") {
    for (auto it = mLogDomains.begin(); it != mLogDomains.end(); ++it)
      apply(**it);
    return;
  }
  const auto log = logDomain(cmd.c_str());
  if (log == nullptr)
    mathic::reportError("Unknown log \"" + cmd + "\".");
  apply(*log);
}

void LogDomainSet::printReport(std::ostream& out) const {
  printCountReport(out);
  printTimeReport(out);
}

void LogDomainSet::printCountReport(std::ostream& out) const {
  mathic::ColumnPrinter pr;
  auto& names = pr.addColumn(true);
  auto& counts = pr.addColumn(false);

  names << "Log name  \n";
  counts << "  Count\n";
  pr.repeatToEndOfLine('-');

  bool somethingToReport = false;
  const auto end = logDomains().cend();
  for (auto it = logDomains().cbegin(); it != end; ++it) {
    const auto& log = **it;
    if (!log.enabled() || !log.hasCount())
      continue;
    somethingToReport = true;
    names << log.name() << '\n';
    counts << mathic::ColumnPrinter::commafy(log.count()) << '\n';
  }
  if (!somethingToReport)
    return;
  out << "***** Count report *****\n\n" << pr << '\n';
}

void LogDomainSet::printTimeReport(std::ostream& out) const {
  const auto allTime = (tbb::tick_count::now() - mStartTime).seconds();

  mathic::ColumnPrinter pr;
  auto& names = pr.addColumn(true);
  auto& times = pr.addColumn(false);
  auto& ratios = pr.addColumn(false);
  times.precision(3);
  times << std::fixed;
  ratios.precision(3);
  ratios << std::fixed;

  names << "Log name  \n";
  times << "  Time/s (real)\n";
  ratios << "  Ratio\n";
  pr.repeatToEndOfLine('-');

  double timeSum = 0;
  bool somethingToReport = false;
  const auto end = logDomains().cend();
  for (auto it = logDomains().cbegin(); it != end; ++it) {
    const auto& log = **it;
    if (!log.enabled() || !log.hasTime())
      continue;
    somethingToReport = true;

    const auto logTime = log.loggedSecondsReal();
    timeSum += logTime;
    names << log.name() << '\n';
    times << logTime << '\n';
    ratios << mathic::ColumnPrinter::percentDouble(logTime, allTime) << '\n';
  }
  if (!somethingToReport)
    return;
  pr.repeatToEndOfLine('-');
  names << "sum\n";
  times << timeSum;
  ratios << mathic::ColumnPrinter::percentDouble(timeSum, allTime) << '\n';

  const auto oldFlags = out.flags();
  const auto oldPrecision = out.precision();
  out << std::fixed;
  out.precision(3);
  out << "***** Time report *****\nTime elapsed: "
    << allTime << "s\n\n" << pr << '\n';
  out.precision(oldPrecision);
  out.flags(oldFlags);
}

void LogDomainSet::reset() {
  mStartTime = tbb::tick_count::now();
  for (auto it = mLogDomains.begin(); it != mLogDomains.end(); ++it)
    (*it)->reset();
}

LogDomainSet& LogDomainSet::singleton() {
  static LogDomainSet set;
  return set;
}

MATHICIDEAL_NAMESPACE_END
