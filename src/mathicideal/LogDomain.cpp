// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "LogDomain.hpp"

#include "LogDomainSet.hpp"
#include <iostream>

MATHICIDEAL_NAMESPACE_BEGIN

LogDomain<true>::LogDomain(
  const char* const name,
  const char* const description,
  const bool enabled,
  const bool streamEnabled
):
  mEnabled(enabled),
  mStreamEnabled(streamEnabled),
  mName(name),
  mDescription(description),
  mSeconds(0),
  mHasTime(false),
  mCount(0),
  mHasCount(false)
{
  LogDomainSet::singleton().registerLogDomain(*this);
}

std::ostream& LogDomain<true>::stream() {
  return std::cerr;
}

LogDomain<true>::Timer LogDomain<true>::timer() {
  return Timer(*this);
}

void LogDomain<true>::increment(Counter by) {
  if (!enabled())
    return;
  mCount += by;
  mHasCount = true;
}

void LogDomain<true>::reset() {
  mSeconds = 0;
  mHasTime = false;
  mCount = 0;
  mHasCount = false;
}

void LogDomain<true>::recordTime(double seconds) {
  if (!enabled())
    return;
  mSeconds += seconds;
  mHasTime = true;

  if (streamEnabled()) {
    MATHICIDEAL_ASSERT(mName != nullptr);
    const auto oldFlags = stream().flags();
    const auto oldPrecision = stream().precision();
    stream().precision(3);
    stream() << mName << " time recorded: " << std::fixed << seconds
      << "s (real)" << std::endl;
    stream().precision(oldPrecision);
    stream().flags(oldFlags);
  }
}

LogDomain<true>::Timer::Timer(LogDomain<true>& logger):
  mLogger(logger),
  mTimerRunning(false),
  mRealTicks()
{
  start();
}

LogDomain<true>::Timer::~Timer() {
  stop();
}

void LogDomain<true>::Timer::stop() {
  if (!running())
    return;
  mTimerRunning = false;
  if (!mLogger.enabled())
    return;
  mLogger.recordTime((tbb::tick_count::now() - mRealTicks).seconds());
}

void LogDomain<true>::Timer::start() {
  if (!mLogger.enabled() || mTimerRunning)
    return;
  mTimerRunning = true;
  mRealTicks = tbb::tick_count::now();
}

MATHICIDEAL_NAMESPACE_END
