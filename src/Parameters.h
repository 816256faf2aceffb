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

#ifndef SRC_PARAMETERS_H_
#define SRC_PARAMETERS_H_

#include <map>
#include <string>
#include <utility>

#include "tools/Tools.h"

// Solution statuses
//
enum Status { UNSOLVED, FEASIBLE, INFEASIBLE, TIME_LIMIT };
static const std::map<Status, std::string> statusToString = {
    {UNSOLVED, "UNSOLVED"},
    {FEASIBLE, "FEASIBLE"},
    {INFEASIBLE, "INFEASIBLE"},
    {TIME_LIMIT, "TIME_LIMIT"}
};

// Order in which the cover requirements are processed by the greedy
//  UNDER_WEIGHT: decreasing weight for under coverage (stable)
//  INPUT: order of the instance file
//  DAY: increasing day (stable)
//
enum RequirementOrder { UNDER_WEIGHT, INPUT_ORDER, DAY_ORDER };
static const std::map<std::string, RequirementOrder> requirementOrdersByName = {
    {"UNDER_WEIGHT", UNDER_WEIGHT},
    {"INPUT", INPUT_ORDER},
    {"DAY", DAY_ORDER}
};

// Order in which the staff members are tried for each requirement.
// Only the order of the instance is available.
//
enum StaffOrder { STAFF_INPUT_ORDER };
static const std::map<std::string, StaffOrder> staffOrdersByName = {
    {"INPUT", STAFF_INPUT_ORDER}
};

// Assignment(s) against which the forbidden successions are checked
//  LAST_INSERTED: the last assignment inserted for the staff member
//  PREVIOUS_DAY: the assignment with the greatest day before the candidate
//  ADJACENT_DAYS: all the assignments of the day before and of the day after
//
enum SuccessionLookup { LAST_INSERTED, PREVIOUS_DAY, ADJACENT_DAYS };
static const std::map<std::string, SuccessionLookup>
    successionLookupsByName = {
    {"LAST_INSERTED", LAST_INSERTED},
    {"PREVIOUS_DAY", PREVIOUS_DAY},
    {"ADJACENT_DAYS", ADJACENT_DAYS}
};

// Days counted in the run of consecutive worked days of a candidate
//  BACKWARD: only the days before the candidate
//  BOTH_WAYS: the days before and after the candidate
//
enum ConsecutiveRunScan { BACKWARD, BOTH_WAYS };
static const std::map<std::string, ConsecutiveRunScan>
    consecutiveRunScansByName = {
    {"BACKWARD", BACKWARD},
    {"BOTH_WAYS", BOTH_WAYS}
};

//-----------------------------------------------------------------------------
//
//  C l a s s   G r e e d y O p t i o n s
//
//  Options of the greedy. They can be read from a file of lines field=value.
//  The default values build the roster by decreasing weight of the cover
//  requirements and keep going after an unmet requirement.
//
//-----------------------------------------------------------------------------
class GreedyOptions {
 public:
  GreedyOptions() = default;
  explicit GreedyOptions(int verbose, std::string logfile = "") :
      verbose_(verbose), logfile_(std::move(logfile)) {}
  ~GreedyOptions() = default;

  // read one field in the stream: return false if the field is unknown
  bool setParameter(const std::string &field, std::fstream *file);

  // read all the options of the given file
  void read(const std::string &strFile);

  std::string toString() const;

  RequirementOrder requirementOrder_ = UNDER_WEIGHT;
  StaffOrder staffOrder_ = STAFF_INPUT_ORDER;
  SuccessionLookup successionLookup_ = LAST_INSERTED;
  ConsecutiveRunScan consecutiveRunScan_ = BACKWARD;

  // true -> stop the greedy at the first requirement that cannot be met
  bool stopAtFirstUnmet_ = false;

  // time limit checked between two requirements (none if <= 0)
  double maxSolvingTimeSeconds_ = -1;

  // 0: summary only, 1: coverage and audit reports, 2: trace of the greedy
  int verbose_ = 0;

  // log file (empty for stdout)
  std::string logfile_;

  bool hasTimeLimit() const { return maxSolvingTimeSeconds_ > 0; }
};

#endif  // SRC_PARAMETERS_H_
