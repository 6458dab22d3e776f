// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "mathicideal/stdinc.h"

#include "mathicideal/LogDomain.hpp"
#include "mathicideal/LogDomainSet.hpp"
#include "mathicideal/IdealFactory.hpp"
#include "testHelpers.hpp"
#include <mathic.h>
#include <gtest/gtest.h>
#include <sstream>

MATHICIDEAL_NAMESPACE_BEGIN
MATHICIDEAL_DEFINE_LOG_DOMAIN(TestLog, "A log for the log tests.");
MATHICIDEAL_DEFINE_LOG_DOMAIN_WITH_DEFAULTS(
  TestLogOff,
  "A log that is disabled at compile time.",
  1, 1, 0
);
MATHICIDEAL_NAMESPACE_END

using namespace mid;

namespace {
  /// Restores the enabled and streaming state of every log on destruction.
  class LogStateGuard {
  public:
    LogStateGuard() {
      const auto& logs = LogDomainSet::singleton().logDomains();
      for (auto it = logs.begin(); it != logs.end(); ++it)
        mStates.push_back
          (State((*it)->enabled(), (*it)->streamEnabledPure()));
      LogDomainSet::singleton().reset();
    }

    ~LogStateGuard() {
      const auto& logs = LogDomainSet::singleton().logDomains();
      for (size_t i = 0; i < logs.size(); ++i) {
        logs[i]->setEnabled(mStates[i].first);
        logs[i]->setStreamEnabled(mStates[i].second);
      }
      LogDomainSet::singleton().reset();
    }

  private:
    typedef std::pair<bool, bool> State;
    std::vector<State> mStates;
  };
}

TEST(LogDomain, Defaults) {
  const auto& log = MATHICIDEAL_LOGGER(TestLog);
  EXPECT_STREQ("TestLog", log.name());
  EXPECT_STREQ("A log for the log tests.", log.description());
  EXPECT_FALSE(log.enabled());
  EXPECT_TRUE(log.streamEnabledPure());
  EXPECT_FALSE(log.streamEnabled());

  EXPECT_EQ(&MATHICIDEAL_LOGGER(TestLog),
    LogDomainSet::singleton().logDomain("TestLog"));
  EXPECT_NE(nullptr, LogDomainSet::singleton().logDomain("IdealConstruct"));
}

TEST(LogDomain, CompileTimeDisabled) {
  const bool compileTimeEnabled =
    MATHICIDEAL_LOGGER_TYPE(TestLogOff)::compileTimeEnabled;
  EXPECT_FALSE(compileTimeEnabled);
  EXPECT_FALSE(MATHICIDEAL_LOGGER(TestLogOff).enabled());
  EXPECT_EQ(nullptr, LogDomainSet::singleton().logDomain("TestLogOff"));
  EXPECT_THROW(LogDomainSet::singleton().performLogCommand("TestLogOff"),
    mathic::MathicException);

  bool evaluated = false;
  MATHICIDEAL_LOG(TestLogOff) << (evaluated = true);
  EXPECT_FALSE(evaluated);
}

TEST(LogDomain, Commands) {
  LogStateGuard guard;
  auto& set = LogDomainSet::singleton();
  auto& log = MATHICIDEAL_LOGGER(TestLog);

  set.performLogCommand("TestLog");
  EXPECT_TRUE(log.enabled());
  EXPECT_TRUE(log.streamEnabledPure());

  set.performLogCommand("-TestLog");
  EXPECT_FALSE(log.enabled());

  set.performLogCommand("+TestLog-");
  EXPECT_TRUE(log.enabled());
  EXPECT_FALSE(log.streamEnabledPure());

  set.performLogCommand("0TestLog+");
  EXPECT_TRUE(log.enabled());
  EXPECT_TRUE(log.streamEnabledPure());

  set.performLogCommand("-TestLog0");
  EXPECT_FALSE(log.enabled());
  EXPECT_TRUE(log.streamEnabledPure());

  set.performLogCommands("TestLog-,,none");
  EXPECT_TRUE(log.enabled());
  EXPECT_FALSE(log.streamEnabledPure());

  EXPECT_THROW(set.performLogCommand("NoSuchLog"), mathic::MathicException);
  EXPECT_THROW(set.performLogCommand(""), mathic::MathicException);
  EXPECT_THROW(set.performLogCommand("+"), mathic::MathicException);
  EXPECT_THROW(set.performLogCommands("TestLog,NoSuchLog"),
    mathic::MathicException);
}

TEST(LogDomain, All) {
  LogStateGuard guard;
  auto& set = LogDomainSet::singleton();
  const auto& logs = set.logDomains();

  set.performLogCommand("+all-");
  for (auto it = logs.begin(); it != logs.end(); ++it) {
    EXPECT_TRUE((*it)->enabled()) << (*it)->name();
    EXPECT_FALSE((*it)->streamEnabled()) << (*it)->name();
  }

  set.performLogCommand("-all");
  for (auto it = logs.begin(); it != logs.end(); ++it)
    EXPECT_FALSE((*it)->enabled()) << (*it)->name();
}

TEST(LogDomain, Count) {
  LogStateGuard guard;
  auto& log = MATHICIDEAL_LOGGER(TestLog);

  log.setEnabled(false);
  MATHICIDEAL_LOG_INCREMENT(TestLog);
  EXPECT_FALSE(log.hasCount());
  EXPECT_EQ(0u, log.count());

  log.setEnabled(true);
  log.setStreamEnabled(false);
  MATHICIDEAL_LOG_INCREMENT(TestLog);
  MATHICIDEAL_LOG_INCREMENT_BY(TestLog, 2);
  EXPECT_TRUE(log.hasCount());
  EXPECT_EQ(3u, log.count());

  std::ostringstream out;
  LogDomainSet::singleton().printCountReport(out);
  EXPECT_NE(std::string::npos, out.str().find("TestLog"));

  log.reset();
  EXPECT_FALSE(log.hasCount());
  EXPECT_EQ(0u, log.count());
}

TEST(LogDomain, Time) {
  LogStateGuard guard;
  auto& log = MATHICIDEAL_LOGGER(TestLog);
  log.setEnabled(true);
  log.setStreamEnabled(false);
  EXPECT_FALSE(log.hasTime());
  {
    MATHICIDEAL_LOG_TIME(TestLog) << "not shown";
  }
  EXPECT_TRUE(log.hasTime());
  EXPECT_LE(0.0, log.loggedSecondsReal());

  auto timer = log.timer();
  EXPECT_TRUE(timer.running());
  timer.stop();
  EXPECT_FALSE(timer.running());

  log.setEnabled(false);
  timer.start();
  EXPECT_FALSE(timer.running());

  log.setEnabled(true);
  std::ostringstream out;
  LogDomainSet::singleton().printTimeReport(out);
  EXPECT_NE(std::string::npos, out.str().find("Time report"));
}

TEST(LogDomain, IdealConstructionIsCounted) {
  LogStateGuard guard;
  auto& set = LogDomainSet::singleton();
  set.performLogCommand("+IdealConstruct-");
  const auto zz = ringFromString("ZZ");
  makeIdeal(*zz, elem(*zz, "6"));
  makeIdeal(*zz, elems(*zz, "4, 6"));
  EXPECT_EQ(2u, set.logDomain("IdealConstruct")->count());
}
