/*
 * Copyright (C) 2020 Antoine Legrain, Jeremy Omer, and contributors.
 * All Rights Reserved.
 *
 * You may use, distribute and modify this code under the terms of the MIT
 * license.
 *
 * Please see the LICENSE file or visit https://opensource.org/licenses/MIT for
 * full license detail.
 */

#ifndef SRC_TOOLS_INPUTPATHS_H_
#define SRC_TOOLS_INPUTPATHS_H_

#include <string>

#include "tools/Tools.h"

// The instances of this class contain the paths of the input and output files
// of the problem and the options given on the command line
class InputPaths {
 public:
  InputPaths() = default;

  explicit InputPaths(const std::string &instance,
                      const std::string &solutionPath = "",
                      const std::string &logPath = "",
                      const std::string &paramFile = "",
                      double timeOut = -1,
                      int verbose = -1);

 protected:
  std::string instance_;
  std::string solutionPath_;
  std::string logPath_;
  std::string paramFile_;
  // -1 if not set on the command line
  double timeOut_ = -1;
  int verbose_ = -1;

 public:
  // get/set attributes
  const std::string &instance() const { return instance_; }
  void instance(const std::string &instance) { instance_ = instance; }

  const std::string &paramFile() const { return paramFile_; }
  void paramFile(const std::string &file) { paramFile_ = file; }
  const std::string &solutionPath() const { return solutionPath_; }
  void solutionPath(const std::string &path) { solutionPath_ = path; }
  const std::string &logPath() const { return logPath_; }
  void logPath(const std::string &path) { logPath_ = path; }

  double timeOut() const { return timeOut_; }
  void timeOut(double t) { timeOut_ = t; }

  int verbose() const { return verbose_; }
  void verbose(int verbose) { verbose_ = verbose; }

  std::string toString() const;
};

#endif  // SRC_TOOLS_INPUTPATHS_H_
