// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_HELP_ACTION_GUARD
#define MATHICIDEAL_HELP_ACTION_GUARD

#include <mathic.h>

MATHICIDEAL_NAMESPACE_BEGIN

/// mathic's help action plus the topic "logs".
class HelpAction : public mathic::HelpAction {
public:
  virtual void performAction();
};

MATHICIDEAL_NAMESPACE_END

#endif
