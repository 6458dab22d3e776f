// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifdef MATHICIDEAL_STDINC_GUARD
#error stdinc.h included twice. Only include stdinc.h once per cpp file.
#endif
#define MATHICIDEAL_STDINC_GUARD

#ifdef _MSC_VER // For Microsoft Compiler in Visual Studio C++.

// Sometimes you know that a function will be called very rarely so you want to
// tell the compiler not to inline it even if it could be inlined at only a
// modest increase in code size. That is what MATHICIDEAL_NO_INLINE does.
#define MATHICIDEAL_NO_INLINE __declspec(noinline)

// Tells the compiler that the current line of code cannot be reached.
#define MATHICIDEAL_UNREACHABLE __assume(false)

#pragma warning (disable: 4996) // std::copy on pointers is flagged as dangerous
#pragma warning (disable: 4127) // Warns about using "while (true)".
#pragma warning (disable: 4100) // Warns about unused parameters.
#pragma warning (disable: 4800) // Warns on int to bool conversion.

#elif defined (__GNUC__) // GCC compiler

#define MATHICIDEAL_NO_INLINE __attribute__((noinline))
#define MATHICIDEAL_UNREACHABLE __builtin_unreachable()

#else

#define MATHICIDEAL_NO_INLINE
#define MATHICIDEAL_UNREACHABLE

#endif

#include <cstddef>
#include <memory>
#include <utility>

#ifdef MATHICIDEAL_DEBUG
#include <iostream> // Useful for debugging.
#include <cassert>
#define MATHICIDEAL_ASSERT(X) do{assert(X);}while(0)
#define MATHICIDEAL_IF_DEBUG(X) X
#else
#define MATHICIDEAL_ASSERT(X)
#define MATHICIDEAL_IF_DEBUG(X)
#endif

#define MATHICIDEAL_NAMESPACE_BEGIN namespace mid {
#define MATHICIDEAL_NAMESPACE_END }

/// Concatenates A and B after both have been macro expanded. A plain ## does
/// not expand its arguments first.
#define MATHICIDEAL_CONCATENATE(A,B) A##B
#define MATHICIDEAL_CONCATENATE_AFTER_EXPANSION(A,B) MATHICIDEAL_CONCATENATE(A,B)

MATHICIDEAL_NAMESPACE_BEGIN

/*
See http://herbsutter.com/gotw/_102/ for a reason to have a
make_unique function. std::make_unique is C++14, so here it is for C++11.
*/
template<class T, class... Args>
std::unique_ptr<T> make_unique(Args&&... args) {
  return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
}

typedef unsigned long long uint64;
typedef unsigned int uint32;
typedef signed long long int64;
typedef signed int int32;

MATHICIDEAL_NAMESPACE_END
