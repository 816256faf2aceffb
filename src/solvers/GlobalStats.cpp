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

#include "solvers/GlobalStats.h"

#include <sstream>
#include <string>

// write all the stats
std::string GlobalStats::toString() const {
  std::stringstream statStream;
  statStream.precision(3);
  statStream.setf(std::ios::fixed, std::ios::floatfield);

  statStream << "status=" << statusToString.at(status_) << std::endl;
  statStream << "assignments=" << nAssignments_ << std::endl;
  statStream << "requirements=" << nRequirements_ << std::endl;
  statStream << "processedRequirements=" << nRequirementsProcessed_
             << std::endl;
  statStream << "unmetRequirements=" << nUnmetRequirements_ << std::endl;
  statStream << "totalShortfall=" << totalShortfall_ << std::endl;
  statStream << "weightedShortfall=" << weightedShortfall_ << std::endl;
  statStream << "feasibilityChecks=" << nFeasibilityChecks_ << std::endl;
  statStream << "timeTotal=" << timeTotal_ << std::endl;

  return statStream.str();
}
