// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_IDEAL_ACTION_GUARD
#define MATHICIDEAL_IDEAL_ACTION_GUARD

#include "CommonParams.hpp"
#include <mathic.h>

MATHICIDEAL_NAMESPACE_BEGIN

/// Reads an ideal from a file and displays what is known about it.
class IdealAction : public mathic::Action {
public:
  IdealAction();

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
  mathic::StringParameter mReduce;
  mathic::StringParameter mContains;
  mathic::BoolParameter mOutput;
};

MATHICIDEAL_NAMESPACE_END
#endif
