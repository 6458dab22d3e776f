// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Scanner.hpp"

#include <mathic.h>
#include <sstream>
#include <cstring>

MATHICIDEAL_NAMESPACE_BEGIN

static const size_t BufferSize = 10 * 1024;

Scanner::Scanner(std::istream& input):
  mStream(&input),
  mLineCount(1),
  mChar(' '),
  mBuffer(),
  mBufferPos(mBuffer.end())
{
  mBuffer.reserve(BufferSize);
  mBufferPos = mBuffer.end();
  get();
}

Scanner::Scanner(const char* const input):
  mStream(nullptr),
  mLineCount(1),
  mChar(' '),
  mBuffer(input, input + std::strlen(input)),
  mBufferPos(mBuffer.begin())
{
  get();
}

Scanner::Scanner(const std::string& input):
  mStream(nullptr),
  mLineCount(1),
  mChar(' '),
  mBuffer(input.begin(), input.end()),
  mBufferPos(mBuffer.begin())
{
  get();
}

void Scanner::reportError(const std::string& msg) const {
  std::ostringstream err;
  err << "Syntax error on line " << mLineCount << ": " << msg;
  mathic::reportError(err.str());
}

void Scanner::expect(const char* str) {
  MATHICIDEAL_ASSERT(str != nullptr);

  eatWhite();

  const char* it = str;
  while (*it != '\0') {
    int character = get();
    if (*it == character) {
      ++it;
      continue;
    }

    // Read the rest of what is there to improve error message.
    std::ostringstream got;
    if (character == EOF && it == str)
      got << "no more input";
    else {
      got << '\"' << std::string(str, it);
      if (std::isalnum(character))
        got << static_cast<char>(character);
      while (std::isalnum(peek()))
        got << static_cast<char>(get());
      got << '\"';
    }

    reportErrorUnexpectedToken('\"' + std::string(str) + '\"', got.str());
  }
}

void Scanner::expectEOF() {
  eatWhite();
  if (peek() != EOF)
    reportErrorUnexpectedToken("no more input", get());
}

mpz_class Scanner::readMpz() {
  eatWhite();
  if (!std::isdigit(peek()))
    reportErrorUnexpectedToken("an integer", peek());
  std::string digits;
  while (std::isdigit(peek()))
    digits += static_cast<char>(get());
  return mpz_class(digits, 10);
}

std::string Scanner::readIdentifier() {
  if (!peekIdentifier())
    reportErrorUnexpectedToken("an identifier", peek());
  std::string identifier;
  while (std::isalnum(peek()) || peek() == '_')
    identifier += static_cast<char>(get());
  return identifier;
}

void Scanner::errorExpectOne(char expected, int got) {
  MATHICIDEAL_ASSERT(expected != got);
  std::ostringstream err;
  err << '\'' << expected << '\'';
  reportErrorUnexpectedToken(err.str(), got);
}

void Scanner::reportErrorUnexpectedToken(const std::string& expected, int got) {
  std::ostringstream gotDescription;
  if (got == EOF)
    gotDescription << "no more input";
  else
    gotDescription << '\'' << static_cast<char>(got) << '\'';
  reportErrorUnexpectedToken(expected, gotDescription.str());
}

void Scanner::reportErrorUnexpectedToken(
  const std::string& expected,
  const std::string& got
) {
  std::ostringstream errorMsg;
  errorMsg << "Expected " << expected;
  if (got != "")
    errorMsg << ", but got " << got;
  errorMsg << '.';
  reportError(errorMsg.str());
}

int Scanner::readBuffer() {
  if (mStream == nullptr)
    return EOF;
  if (!mStream->good())
    return EOF;
  mBuffer.resize(BufferSize);
  mStream->read(mBuffer.data(), mBuffer.size());
  const auto read = static_cast<size_t>(mStream->gcount());
  mBuffer.resize(read);
  mBufferPos = mBuffer.begin();
  if (read == 0)
    return EOF;
  const auto c = static_cast<unsigned char>(*mBufferPos);
  ++mBufferPos;
  return c;
}

MATHICIDEAL_NAMESPACE_END
