// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_BENCH_ACTION_GUARD
#define MATHICIDEAL_BENCH_ACTION_GUARD

#include "CommonParams.hpp"
#include <mathic.h>

MATHICIDEAL_NAMESPACE_BEGIN

/// Writes a benchmark ideal to standard output in the format that the ideal
/// action reads.
class BenchAction : public mathic::Action {
public:
  BenchAction();

  virtual void directOptions(
    std::vector<std::string> tokens,
    mathic::CliParser& parser
  );

  virtual void performAction();

  static const char* staticName();

  virtual const char* name() const;
  virtual const char* description() const;
  virtual const char* shortDescription() const;

  virtual void pushBackParameters
    (std::vector<mathic::CliParameter*>& parameters);

private:
  CommonParams mParams;
  mathic::StringParameter mRing;
  mathic::IntegerParameter mVarCount;
  mathic::BoolParameter mHomogeneous;
};

MATHICIDEAL_NAMESPACE_END
#endif
