// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_LOG_DOMAIN_SET_GUARD
#define MATHICIDEAL_LOG_DOMAIN_SET_GUARD

#include "LogDomain.hpp"
#include <tbb/tick_count.h>
#include <string>
#include <vector>
#include <ostream>

MATHICIDEAL_NAMESPACE_BEGIN

class LogDomainSet {
public:
  void registerLogDomain(LogDomain<true>& domain);
  void registerLogDomain(const LogDomain<false>&) {}

  /// A log command has the format AXB, where
  ///   X       the name of a compile-time enabled log domain, or all, or none
  ///   A       a prefix
  ///   B       a suffix
  /// The possible values of A are
  ///           enable X (this is the empty string)
  ///   +       enable X
  ///   -       disable X
  ///   0       leave X enabled or disabled as it is
  /// The possible values of B are
  ///           leave streaming as it is (this is the empty string)
  ///   +       turn streaming on for X
  ///   -       turn streaming off for X
  ///   0       leave streaming as it is
  ///
  /// No white-space is allowed. A command that cannot be parsed or that
  /// names an unknown log is reported through mathic::reportError.
  ///
  /// *** Example ***
  ///   "+MyLog-" enables MyLog, but silences any streaming from it.
  ///   "-MyLog+" disables MyLog, but sets the streaming state to on. As
  ///     MyLog is disabled there is still no streaming output.
  ///   "0all-" turns off all streaming without enabling or disabling
  ///     any logs.
  void performLogCommand(std::string cmd);

  /// Performs a comma-seperated list of commands. No white-space is allowed.
  void performLogCommands(const std::string& cmds);

  /// Returns null if there is no compile-time enabled log with that name.
  LogDomain<true>* logDomain(const char* const name);

  const std::vector<LogDomain<true>*>& logDomains() const {return mLogDomains;}

  void printReport(std::ostream& out) const;
  void printTimeReport(std::ostream& out) const;
  void printCountReport(std::ostream& out) const;

  /// Clears the time and count of every log and restarts the clock.
  void reset();

  static LogDomainSet& singleton();

private:
  LogDomainSet(); // private for singleton

  std::vector<LogDomain<true>*> mLogDomains;
  tbb::tick_count mStartTime;
};

MATHICIDEAL_NAMESPACE_END

#endif
