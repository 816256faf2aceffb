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

#include "tools/InputPaths.h"

#include <sstream>

/******************************************************************************
* The instances of InputPaths contain the paths of the input files of the
* problem
*******************************************************************************/
InputPaths::InputPaths(const std::string &instance,
                       const std::string &solutionPath,
                       const std::string &logPath,
                       const std::string &paramFile,
                       double timeOut,
                       int verbose) :
    instance_(instance),
    solutionPath_(solutionPath),
    logPath_(logPath),
    paramFile_(paramFile),
    timeOut_(timeOut),
    verbose_(verbose) {}

std::string InputPaths::toString() const {
  std::stringstream rep;
  rep << "Instance      : " << instance_ << std::endl;
  if (!solutionPath_.empty())
    rep << "Solution path : " << solutionPath_ << std::endl;
  if (!logPath_.empty())
    rep << "Log file      : " << logPath_ << std::endl;
  if (!paramFile_.empty())
    rep << "Options file  : " << paramFile_ << std::endl;
  if (timeOut_ > 0)
    rep << "Time limit    : " << timeOut_ << " s" << std::endl;
  return rep.str();
}
