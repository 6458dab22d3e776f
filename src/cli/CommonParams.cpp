// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "mathicideal/stdinc.h"
#include "CommonParams.hpp"

#include "mathicideal/LogDomainSet.hpp"

MATHICIDEAL_NAMESPACE_BEGIN

CommonParams::CommonParams(size_t minDirectParams, size_t maxDirectParams):
  mThreadCount("threadCount",
    "Specifies how many threads to use at a time. A value of 0 lets TBB "
    "decide.",
    0),

  mLogs("logs",
    "Enable the specified log. Do \"help logs\" to see all available logs. "
    "To enable logs X, Y and Z, do \"-logs X,Y,Z\".",
    ""),

  mMinDirectParams(minDirectParams),
  mMaxDirectParams(maxDirectParams)
{
}

void CommonParams::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  if (tokens.size() < mMinDirectParams)
    mathic::reportError("Too few direct options");
  if (tokens.size() > mMaxDirectParams)
    mathic::reportError("Too many direct options");
  mDirectParameters = std::move(tokens);
}

void CommonParams::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  parameters.push_back(&mLogs);
  parameters.push_back(&mThreadCount);
}

void CommonParams::perform() {
  LogDomainSet::singleton().performLogCommands(mLogs.value());

  // delete the old control first so that the new one takes effect.
  mThreadControl.reset();
  if (mThreadCount.value() != 0) {
    mThreadControl = make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism,
      static_cast<size_t>(mThreadCount.value())
    );
  }
}

void CommonParams::registerFileNameExtension(std::string extension) {
  MATHICIDEAL_ASSERT(!extension.empty());
  mExtensions.push_back(std::move(extension));
}

size_t CommonParams::inputFileCount() const {
  return mDirectParameters.size();
}

std::string CommonParams::inputFileName(size_t i) const {
  MATHICIDEAL_ASSERT(i < inputFileCount());
  return mDirectParameters[i];
}

std::string CommonParams::inputFileNameStem(size_t i) const {
  MATHICIDEAL_ASSERT(i < inputFileCount());
  const auto& str = mDirectParameters[i];
  const auto toStrip = inputFileNameExtension(i);
  MATHICIDEAL_ASSERT
    (toStrip.size() < str.size() || (toStrip.empty() && str.empty()));
  return str.substr(0, str.size() - toStrip.size());
}

std::string CommonParams::inputFileNameExtension(size_t i) const {
  MATHICIDEAL_ASSERT(i < inputFileCount());
  const auto& str = mDirectParameters[i];
  const auto end = mExtensions.end();
  for (auto it = mExtensions.begin(); it != end; ++it) {
    if (
      str.size() >= it->size() &&
      str.compare(str.size() - it->size(), it->size(), *it) == 0
    )
      return *it;
  }
  return std::string();
}

MATHICIDEAL_NAMESPACE_END
