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

#ifndef SRC_SOLVERS_GLOBALSTATS_H_
#define SRC_SOLVERS_GLOBALSTATS_H_

#include <string>

#include "Parameters.h"

//-----------------------------------------------------------------------------
//
//  S t r u c t   G l o b a l S t a t s
//
//  Set of statistics of a run of the greedy
//
//-----------------------------------------------------------------------------

struct GlobalStats {
  // constructor and destructor
  //
  GlobalStats() = default;
  ~GlobalStats() = default;

  // status of the final roster
  //
  Status status_ = UNSOLVED;

  // size of the roster
  //
  int nAssignments_ = 0;

  // cover requirements: total, processed before the end of the greedy and
  // not covered at the end
  //
  int nRequirements_ = 0;
  int nRequirementsProcessed_ = 0;
  int nUnmetRequirements_ = 0;

  // number of missing staff members over all the requirements and the same
  // number weighted by the weight for under coverage
  //
  int totalShortfall_ = 0;
  int weightedShortfall_ = 0;

  // number of calls to the validity check
  //
  int nFeasibilityChecks_ = 0;

  // global runtime
  //
  double timeTotal_ = 0.0;

  // write all the stats
  std::string toString() const;
};

#endif  // SRC_SOLVERS_GLOBALSTATS_H_
