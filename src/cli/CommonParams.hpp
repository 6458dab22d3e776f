// MathicIdeal copyright 2012 all rights reserved. MathicIdeal comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef MATHICIDEAL_COMMON_PARAMS_GUARD
#define MATHICIDEAL_COMMON_PARAMS_GUARD

#include <mathic.h>
#include <tbb/global_control.h>
#include <memory>
#include <string>
#include <vector>

MATHICIDEAL_NAMESPACE_BEGIN

/// The parameters that every action of mideal has: -logs and -threadCount,
/// plus the direct parameters such as project names.
class CommonParams {
public:
  CommonParams(size_t minDirectParams, size_t maxDirectParams);

  void directOptions
    (std::vector<std::string> tokens, mathic::CliParser& parser);

  void pushBackParameters(std::vector<mathic::CliParameter*>& parameters);

  /// Takes appropriate action depending on the parameters. For example this
  /// will set the number of threads in tbb.
  void perform();

  /// If called with string X, then X will be considered an extension
  /// for a file name instead of part of the file name.
  void registerFileNameExtension(std::string extension);

  /// Returns the number of direct parameters/input files.
  size_t inputFileCount() const;

  /// Returns the file name at offset i.
  std::string inputFileName(size_t i) const;

  /// Returns the stem of the input file name at offset i, with any registered
  /// extension stripped off.
  std::string inputFileNameStem(size_t i) const;

  /// Returns the registered extension of the input file name at offset i,
  /// if any.
  std::string inputFileNameExtension(size_t i) const;

private:
  mathic::IntegerParameter mThreadCount;
  mathic::StringParameter mLogs;

  std::vector<std::string> mExtensions; /// to recognize file type

  /// limits the number of threads while it exists
  std::unique_ptr<tbb::global_control> mThreadControl;
  size_t mMinDirectParams;
  size_t mMaxDirectParams;
  std::vector<std::string> mDirectParameters;
};

MATHICIDEAL_NAMESPACE_END

#endif
