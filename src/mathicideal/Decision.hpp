// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_DECISION_GUARD
#define MATHICIDEAL_DECISION_GUARD

#include "Errors.hpp"
#include <string>
#include <ostream>

MATHICIDEAL_NAMESPACE_BEGIN

/// The answer to a yes/no question about an ideal, where the answer can also
/// be that there is no algorithm to decide the question. Use known() to find
/// out which it is without risking an exception.
///
/// Converting an unknown answer to bool throws NotImplementedCapability, so
///
///   if (ideal.contains(x)) {...}
///
/// fails loudly rather than silently treating "don't know" as false.
class Decision {
public:
  static Decision yes() {return Decision(Yes, std::string());}
  static Decision no() {return Decision(No, std::string());}
  static Decision unknown(std::string reason) {
    return Decision(Unknown, std::move(reason));
  }
  static Decision from(bool value) {return value ? yes() : no();}

  bool known() const {return mState != Unknown;}
  bool isTrue() const {return mState == Yes;}
  bool isFalse() const {return mState == No;}

  /// Why the answer is unknown. Empty for known answers.
  const std::string& reason() const {return mReason;}

  bool value() const {
    if (!known())
      throw NotImplementedCapability(mReason);
    return isTrue();
  }

  explicit operator bool() const {return value();}

  bool operator==(const Decision& d) const {return mState == d.mState;}
  bool operator!=(const Decision& d) const {return mState != d.mState;}

private:
  enum State {Yes, No, Unknown};

  Decision(State state, std::string reason):
    mState(state), mReason(std::move(reason)) {}

  State mState;
  std::string mReason;
};

inline std::ostream& operator<<(std::ostream& out, const Decision& d) {
  if (d.isTrue())
    return out << "yes";
  if (d.isFalse())
    return out << "no";
  return out << "unknown (" << d.reason() << ')';
}

MATHICIDEAL_NAMESPACE_END

#endif
