// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_LOG_DOMAIN_GUARD
#define MATHICIDEAL_LOG_DOMAIN_GUARD

#include <tbb/tick_count.h>
#include <ostream>

MATHICIDEAL_NAMESPACE_BEGIN

/// A named area of logging that can be turned on or off at runtime and at
/// compile time.
///
/// A log that is turned off at compile time is a LogDomain<false>, which has
/// no state and whose enabled() is the constant false, so the optimizer
/// removes the code that writes to it. Use the logging macroes so that this
/// works.
///
/// Compile-time enabled logs register themselves with
/// LogDomainSet::singleton().
template<bool CompileTimeEnabled>
class LogDomain {};

template<>
class LogDomain<true> {
public:
  static const bool compileTimeEnabled = true;
  typedef unsigned long long Counter;

  LogDomain(
    const char* const name,
    const char* const description,
    const bool enabled,
    const bool streamEnabled
  );

  const char* name() const {return mName;}
  const char* description() const {return mDescription;}
  bool enabled() const {return mEnabled;}

  /// Returns true if the log is enabled and streaming is on.
  bool streamEnabled() const {return enabled() && mStreamEnabled;}

  /// The streaming setting regardless of whether the log is enabled.
  bool streamEnabledPure() const {return mStreamEnabled;}

  void setEnabled(const bool enabled) {mEnabled = enabled;}
  void setStreamEnabled(const bool enabled) {mStreamEnabled = enabled;}

  std::ostream& stream();

  /// Class for recording time that is logged.
  class Timer;

  /// Returns a started timer.
  Timer timer();

  bool hasTime() const {return mHasTime;}
  double loggedSecondsReal() const {return mSeconds;}

  Counter count() const {return mCount;}
  bool hasCount() const {return mHasCount;}

  /// Adds by to the event count of this log if it is enabled.
  void increment(Counter by = 1);

  /// Clears the recorded time and count.
  void reset();

private:
  void recordTime(double seconds);

  bool mEnabled;
  bool mStreamEnabled;
  const char* mName;
  const char* mDescription;

  double mSeconds; /// Total real time recorded on this log.
  bool mHasTime; /// True if any time has been recorded, even 0 seconds.

  Counter mCount;
  bool mHasCount;
};

class LogDomain<true>::Timer {
public:
  /// Starts the timer if the logger is enabled. The elapsed time is logged
  /// to the logger once the timer is stopped or destructed.
  Timer(LogDomain<true>& logger);
  ~Timer();

  bool running() const {return mTimerRunning;}

  /// Stops recording time and logs the elapsed time to the logger. Does
  /// nothing if the timer is not running.
  void stop();

  /// Starts recording time on a stopped timer. Does nothing if the timer is
  /// already running or if the logger is disabled.
  void start();

private:
  LogDomain<true>& mLogger;
  bool mTimerRunning;
  tbb::tick_count mRealTicks;
};

/// A compile-time disabled log.
template<>
class LogDomain<false> {
public:
  static const bool compileTimeEnabled = false;
  typedef unsigned long long Counter;

  LogDomain(const char* const, const char* const, const bool, const bool) {}

  bool enabled() const {return false;}
  bool streamEnabled() const {return false;}

  class Timer {
  public:
    Timer(LogDomain<false>&) {}
    bool running() const {return false;}
    void stop() {}
    void start() {}
  };
  Timer timer() {return Timer(*this);}

  void increment(Counter = 1) {}

  std::ostream& stream() {
    MATHICIDEAL_ASSERT(false);
    return *static_cast<std::ostream*>(nullptr);
  }
};

namespace LogDomainInternal {
  // Support code for the logging macroes

  template<class Tag, bool Default>
  struct SelectValue {static const bool value = Default;};

  template<class> struct Tag_ {};
  template<class> struct Tag_0 {};
  template<class> struct Tag_1 {};

  template<bool Default>
  struct SelectValue<Tag_0<int>, Default> {static const bool value = false;};

  template<bool Default>
  struct SelectValue<Tag_1<int>, Default> {static const bool value = true;};
}

MATHICIDEAL_NAMESPACE_END

/// Defines LogDomainInternal::value_##NAME to be the value of the macro
/// MATHICIDEAL_LOG_##NAME if that macro expands to 0 or 1. Otherwise
/// MATHICIDEAL_LOG_##NAME is ignored and DEFAULT_VALUE is used instead.
#define MATHICIDEAL_CAPTURE_LOG_ENABLED(NAME, DEFAULT_VALUE) \
  namespace LogDomainInternal { \
    template<class> struct Tag_MATHICIDEAL_LOG_##NAME {}; \
    typedef MATHICIDEAL_CONCATENATE_AFTER_EXPANSION \
      (Tag_, MATHICIDEAL_LOG_##NAME)<int> SelectedTag_##NAME; \
    static const bool value_##NAME = \
      SelectValue<SelectedTag_##NAME, DEFAULT_VALUE>::value; \
  }

/// Defines a LogDomain with the given name and description. Must be used
/// inside namespace mid.
///
/// The log is compile-time enabled depending on MATHICIDEAL_LOG_##NAME (see
/// MATHICIDEAL_CAPTURE_LOG_ENABLED), and initially runtime enabled and
/// streaming as given.
#define MATHICIDEAL_DEFINE_LOG_DOMAIN_WITH_DEFAULTS( \
  NAME, DESCRIPTION, \
  DEFAULT_RUNTIME_ENABLED, \
  DEFAULT_STREAM_ENABLED, \
  DEFAULT_COMPILE_TIME_ENABLED \
) \
  MATHICIDEAL_CAPTURE_LOG_ENABLED(NAME, DEFAULT_COMPILE_TIME_ENABLED) \
  namespace logs { \
    typedef LogDomain<LogDomainInternal::value_##NAME> Type##NAME; \
    Type##NAME NAME( \
      #NAME, \
      DESCRIPTION, \
      DEFAULT_RUNTIME_ENABLED, \
      DEFAULT_STREAM_ENABLED \
    ); \
  }

/// Defines a LogDomain that is compile-time enabled, runtime disabled and
/// streaming once enabled.
#define MATHICIDEAL_DEFINE_LOG_DOMAIN(NAME, DESCRIPTION) \
  MATHICIDEAL_DEFINE_LOG_DOMAIN_WITH_DEFAULTS(NAME, DESCRIPTION, 0, 1, 1)

/// Declares a log domain that is defined in another translation unit.
#define MATHICIDEAL_DECLARE_LOG_DOMAIN(NAME) \
  MATHICIDEAL_CAPTURE_LOG_ENABLED(NAME, 1) \
  namespace logs { \
    typedef LogDomain<LogDomainInternal::value_##NAME> Type##NAME; \
    extern Type##NAME NAME; \
  }

/// An l-value reference to the indicated logger.
///
/// Example:
///   auto timer = MATHICIDEAL_LOGGER(MyDomain).timer();
#define MATHICIDEAL_LOGGER(DOMAIN) ::mid::logs::DOMAIN

/// The type of the indicated logger.
#define MATHICIDEAL_LOGGER_TYPE(DOMAIN) ::mid::logs::Type##DOMAIN

/// Runs the following statement only if the indicated logger is streaming.
///
/// Example:
///   MATHICIDEAL_IF_STREAM_LOG(MyDomain) {
///     std::string msg;
///     expensiveFunction(msg);
///     MATHICIDEAL_LOGGER(MyDomain).stream() << msg;
///   }
#define MATHICIDEAL_IF_STREAM_LOG(DOMAIN) \
  if (MATHICIDEAL_LOGGER(DOMAIN).streamEnabled())

/// Displays information to the log using <<. The code after << is not
/// executed if the log is not streaming.
///
/// Example: (f() only called if logger is enabled)
///   MATHICIDEAL_LOG(domain) << "f() = " << f();
#define MATHICIDEAL_LOG(DOMAIN) \
  MATHICIDEAL_IF_STREAM_LOG(DOMAIN) MATHICIDEAL_LOGGER(DOMAIN).stream()

/// Logs the time to execute the remaining code in the current scope to the
/// indicated domain. Also supports printing a message using <<. The message
/// is printed right away while the time is recorded when the scope ends.
///
/// Example:
///   MATHICIDEAL_LOG_TIME(MyDomain) << "Starting timed task";
#define MATHICIDEAL_LOG_TIME(DOMAIN) \
  auto MATHICIDEAL_CONCATENATE_AFTER_EXPANSION( \
    MATHICIDEAL_timer##DOMAIN##_, __LINE__ \
  )(MATHICIDEAL_LOGGER(DOMAIN).timer()); \
  MATHICIDEAL_LOG(DOMAIN)

/// Increments the event count of the indicated domain by BY.
#define MATHICIDEAL_LOG_INCREMENT_BY(DOMAIN, BY) \
  MATHICIDEAL_LOGGER(DOMAIN).increment(BY)

#define MATHICIDEAL_LOG_INCREMENT(DOMAIN) \
  MATHICIDEAL_LOG_INCREMENT_BY(DOMAIN, 1)

#endif
