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

#ifndef SRC_SOLVERS_GREEDY_H_
#define SRC_SOLVERS_GREEDY_H_

#include <vector>

#include "solvers/Solver.h"

//-----------------------------------------------------------------------------
//
//  C l a s s   G r e e d y
//
//  Quick solution of the problem with a greedy: the cover requirements are
//  treated one after the other and each of them is filled with the first staff
//  members that can take it. There is no backtracking.
//
//  Only the days off, the shift limits, the forbidden successions and the
//  maximum number of consecutive days worked are checked when building the
//  roster. The other constraints of the staff members are only audited.
//
//-----------------------------------------------------------------------------

class Greedy : public Solver {
 public:
  // Specific constructor and destructor
  explicit Greedy(PScenario pScenario, GreedyOptions options = GreedyOptions());
  ~Greedy() override = default;

  // Main method to solve the rostering problem: run the constructive greedy
  // and fill the statistics
  Status solve() override;

  // Constructive greedy algorithm
  // Goes through the requirements in the order given by the options and assign
  // the staff members that can take the task in the order of the scenario.
  // Returns true if all the requirements could be covered, and false otherwise
  //
  bool constructiveGreedy();

  // Returns true if the staff member can be assigned the shift on the day
  // given the assignments already in the roster
  //
  bool isFeasibleTask(int staff, int day, int shift) const;

  // requirements in the order in which they are treated by the greedy
  //
  std::vector<CoverRequirement> sortedRequirements() const;

  // staff members in the order in which they are tried for each requirement
  //
  std::vector<int> sortedStaff() const;

  // number of consecutive worked days if the staff member works on day
  //
  int consecutiveRun(int staff, int day) const;

 protected:
  // true if the time limit of the options is reached
  bool isTimeLimitReached();

  // timer of the current run
  Tools::Timer timerSolve_;

  // true if the last run was stopped by the time limit
  bool timeLimitReached_ = false;

 private:
  //----------------------------------------------------------------------------
  // Checks of the validity of an assignment
  //----------------------------------------------------------------------------

  bool respectsShiftLimit(int staff, int shift) const;

  // check the forbidden successions with the shift(s) worked on the previous
  // (and following) day
  bool respectsSuccessions(int staff, int day, int shift) const;
};

#endif  // SRC_SOLVERS_GREEDY_H_
