// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_SCANNER_GUARD
#define MATHICIDEAL_SCANNER_GUARD

#include <gmpxx.h>
#include <istream>
#include <string>
#include <vector>
#include <limits>
#include <cstdio>
#include <cctype>

MATHICIDEAL_NAMESPACE_BEGIN

/// Reads characters from a stream or a string and offers the operations
/// that a hand-written recursive descent parser needs. All syntax errors are
/// reported through mathic::reportError, so they throw
/// mathic::MathicException.
///
/// The expect and read functions skip white-space first. peek() and get()
/// do not.
class Scanner {
public:
  /// Reads from input, which must outlive the Scanner.
  Scanner(std::istream& input);

  /// Reads from a copy of input.
  Scanner(const char* const input);
  Scanner(const std::string& input);

  /// Returns true and reads past c if the next non-white-space character
  /// is c. Otherwise nothing is read except white-space.
  bool match(char c) {
    eatWhite();
    if (peek() != c)
      return false;
    get();
    return true;
  }

  /// Returns true if there is no more input except white-space.
  bool matchEOF() {
    eatWhite();
    return peek() == EOF;
  }

  /// Reads past c, which must be the next non-white-space character.
  void expect(char c) {
    eatWhite();
    const int got = get();
    if (got != c)
      errorExpectOne(c, got);
  }

  /// Reads past str, which must be next after white-space.
  void expect(const char* str);
  void expect(const std::string& str) {expect(str.c_str());}

  void expectEOF();

  /// Returns the next character or EOF and moves past it.
  int get() {
    if (mChar == '\n')
      ++mLineCount;
    const int oldChar = mChar;
    if (mBufferPos == mBuffer.end())
      mChar = readBuffer();
    else {
      mChar = static_cast<unsigned char>(*mBufferPos);
      ++mBufferPos;
    }
    return oldChar;
  }

  /// Returns the next character or EOF without moving past it.
  int peek() const {return mChar;}

  /// As peek() after skipping white-space.
  int peekWhite() {
    eatWhite();
    return peek();
  }

  void eatWhite() {
    while (std::isspace(peek()))
      get();
  }

  /// Returns true if the next non-white-space character is a digit.
  bool peekDigit() {return std::isdigit(peekWhite()) != 0;}

  /// Returns true if an identifier is next after white-space.
  bool peekIdentifier() {
    const int c = peekWhite();
    return std::isalpha(c) || c == '_';
  }

  /// Reads a non-negative integer of any size.
  mpz_class readMpz();

  /// Reads a non-negative integer that fits in T, which must be an integer
  /// type no larger than unsigned long.
  template<class T>
  T readInteger();

  /// Reads an identifier: a letter or _ followed by letters, digits and _.
  std::string readIdentifier();

  /// The line number of the next character, starting from 1.
  uint64 lineCount() const {return mLineCount;}

  /// Reports msg as a syntax error on the current line.
  void reportError(const std::string& msg) const;

  void reportErrorUnexpectedToken(const std::string& expected, int got);
  void reportErrorUnexpectedToken
    (const std::string& expected, const std::string& got);

private:
  void errorExpectOne(char expected, int got);

  int readBuffer();

  std::istream* mStream;
  uint64 mLineCount;
  int mChar; // the next character or EOF
  std::vector<char> mBuffer;
  std::vector<char>::iterator mBufferPos;
};

template<class T>
T Scanner::readInteger() {
  static_assert(std::numeric_limits<T>::is_integer, "T must be an integer");
  const auto value = readMpz();
  const auto max = static_cast<unsigned long>(std::numeric_limits<T>::max());
  if (!value.fits_ulong_p() || value.get_ui() > max)
    reportError("The integer " + value.get_str() + " is too large.");
  return static_cast<T>(value.get_ui());
}

MATHICIDEAL_NAMESPACE_END

#endif
