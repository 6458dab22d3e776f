// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_ERRORS_GUARD
#define MATHICIDEAL_ERRORS_GUARD

#include <stdexcept>
#include <string>

MATHICIDEAL_NAMESPACE_BEGIN

/// Base class of the errors that the ideal code reports. Syntax errors in
/// text input are not among these - they go through mathic::reportError.
class IdealError : public std::runtime_error {
public:
  explicit IdealError(const std::string& msg): std::runtime_error(msg) {}
};

/// A ring or a generator could not be resolved: not a commutative ring,
/// no common parent ring, a value without a parent ring and so on.
class TypeError : public IdealError {
public:
  explicit TypeError(const std::string& msg): IdealError(msg) {}
};

/// An element cannot be mapped into the target ring.
class CoercionError : public TypeError {
public:
  explicit CoercionError(const std::string& msg): TypeError(msg) {}
};

/// The operation is well-defined mathematically but there is no algorithm
/// for it for this ring or this kind of ideal.
class NotImplementedCapability : public IdealError {
public:
  explicit NotImplementedCapability(const std::string& msg): IdealError(msg) {}
};

/// A parameter is outside of its documented range.
class DomainError : public IdealError {
public:
  explicit DomainError(const std::string& msg): IdealError(msg) {}
};

MATHICIDEAL_NAMESPACE_END

#endif
