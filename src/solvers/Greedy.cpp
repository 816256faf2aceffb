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

#include "solvers/Greedy.h"

#include <algorithm>
#include <string>
#include <utility>

using std::vector;

//-----------------------------------------------------------------------------
//
//  C l a s s   G r e e d y
//
//  Quick solution of the problem with a greedy
//
//-----------------------------------------------------------------------------

// Specific constructor
Greedy::Greedy(PScenario pScenario, GreedyOptions options) :
    Solver(std::move(pScenario), std::move(options)),
    timerSolve_("greedy") {}

//----------------------------------------------------------------------------
// Checks of the validity of an assignment
//----------------------------------------------------------------------------

// Returns true if the staff member will respect the hard constraints if
// assigned the input task.
// The checks are ordered from the cheapest to the most expensive.
//
bool Greedy::isFeasibleTask(int staff, int day, int shift) const {
  // Check the days off
  //
  if (pScenario_->isDayOff(staff, day)) return false;

  // Check the maximum number of assignments of the shift
  //
  if (!respectsShiftLimit(staff, shift)) return false;

  // Check the forbidden successor constraint
  //
  if (!respectsSuccessions(staff, day, shift)) return false;

  // Check the maximum number of consecutive days worked
  //
  return consecutiveRun(staff, day) <= pScenario_->staff(staff).maxConsDaysWork_;
}

bool Greedy::respectsShiftLimit(int staff, int shift) const {
  const StaffMember &member = pScenario_->staff(staff);
  if (!member.hasShiftLimit(shift)) return true;
  return roster_.nShiftAssignments(staff, shift) < member.maxShifts(shift);
}

bool Greedy::respectsSuccessions(int staff, int day, int shift) const {
  switch (options_.successionLookup_) {
    case LAST_INSERTED: {
      // the last assignment inserted is not always the one of the greatest day
      // when the requirements are not treated chronologically
      const Assignment *pLast = roster_.lastAssignment(staff);
      return !(pLast && pLast->day == day - 1 &&
          pScenario_->isForbiddenSuccessor(pLast->shift, shift));
    }
    case PREVIOUS_DAY: {
      const Assignment *pPrevious = nullptr;
      for (int id : roster_.staffAssignmentIds(staff)) {
        const Assignment &a = roster_.assignment(id);
        if (a.day < day && (!pPrevious || a.day >= pPrevious->day))
          pPrevious = &a;
      }
      return !(pPrevious && pPrevious->day == day - 1 &&
          pScenario_->isForbiddenSuccessor(pPrevious->shift, shift));
    }
    case ADJACENT_DAYS: {
      for (int id : roster_.staffAssignmentIds(staff)) {
        const Assignment &a = roster_.assignment(id);
        if (a.day == day - 1 && pScenario_->isForbiddenSuccessor(a.shift, shift))
          return false;
        if (a.day == day + 1 && pScenario_->isForbiddenSuccessor(shift, a.shift))
          return false;
      }
      return true;
    }
  }
  Tools::throwError("Unknown succession lookup: %d",
                    static_cast<int>(options_.successionLookup_));
  return false;
}

int Greedy::consecutiveRun(int staff, int day) const {
  // the candidate day is always counted
  int run = 1;
  for (int d = day - 1; d >= 0 && roster_.isWorking(staff, d); --d) ++run;
  if (options_.consecutiveRunScan_ == BOTH_WAYS)
    for (int d = day + 1; d < nDays() && roster_.isWorking(staff, d); ++d)
      ++run;
  return run;
}

//----------------------------------------------------------------------------
// Constructive greedy
//----------------------------------------------------------------------------

vector<CoverRequirement> Greedy::sortedRequirements() const {
  vector<CoverRequirement> requirements = pScenario_->coverRequirements();
  switch (options_.requirementOrder_) {
    case UNDER_WEIGHT:
      std::stable_sort(requirements.begin(), requirements.end(),
                       [](const CoverRequirement &r1,
                          const CoverRequirement &r2) {
                         return r1.weightUnder > r2.weightUnder;
                       });
      break;
    case DAY_ORDER:
      std::stable_sort(requirements.begin(), requirements.end(),
                       [](const CoverRequirement &r1,
                          const CoverRequirement &r2) {
                         return r1.day < r2.day;
                       });
      break;
    case INPUT_ORDER:
      break;
  }
  return requirements;
}

vector<int> Greedy::sortedStaff() const {
  vector<int> staff;
  switch (options_.staffOrder_) {
    case STAFF_INPUT_ORDER:
      for (int n = 0; n < nStaff(); ++n) staff.push_back(n);
      break;
  }
  return staff;
}

bool Greedy::isTimeLimitReached() {
  return options_.hasTimeLimit() &&
      timerSolve_.dSinceStart() >= options_.maxSolvingTimeSeconds_;
}

// Constructive greedy algorithm
// The requirements are treated once, in the order of the options, and the
// assignments are never removed. If a requirement is already partially
// covered, only the missing staff members are assigned.
//
bool Greedy::constructiveGreedy() {
  if (timerSolve_.isStarted()) timerSolve_.stop();
  timerSolve_.start();
  timeLimitReached_ = false;
  stats_.nRequirementsProcessed_ = 0;
  stats_.nFeasibilityChecks_ = 0;

  Tools::LogOutput log(options_.logfile_);
  const vector<int> staffOrder = sortedStaff();
  bool success = true;
  for (const CoverRequirement &req : sortedRequirements()) {
    if (isTimeLimitReached()) {
      timeLimitReached_ = true;
      success = false;
      if (options_.verbose_ >= 1)
        log.printnl("Greedy: time limit reached after %d requirements",
                    stats_.nRequirementsProcessed_);
      break;
    }
    stats_.nRequirementsProcessed_++;

    int needed = req.required - roster_.nAssigned(req.day, req.shift);
    if (needed <= 0) continue;

    // each staff member is tried once for the requirement
    int nAssigned = 0;
    for (int n : staffOrder) {
      if (needed <= 0) break;
      stats_.nFeasibilityChecks_++;
      if (isFeasibleTask(n, req.day, req.shift)) {
        roster_.assign(n, req.day, req.shift);
        needed--;
        nAssigned++;
      }
    }

    if (options_.verbose_ >= 2)
      log.printnl("Greedy: requirement %d (day %d, shift %s, weight %d): "
                  "assigned %d, missing %d",
                  req.num, req.day, pScenario_->shiftName(req.shift).c_str(),
                  req.weightUnder, nAssigned, needed);

    if (needed > 0) {
      success = false;
      if (options_.stopAtFirstUnmet_) break;
    }
  }

  timerSolve_.stop();
  return success;
}

// Main method to solve the rostering problem
//
Status Greedy::solve() {
  bool success = constructiveGreedy();
  if (timeLimitReached_)
    status_ = TIME_LIMIT;
  else
    status_ = success ? FEASIBLE : INFEASIBLE;

  // fill the statistics
  stats_.status_ = status_;
  stats_.nAssignments_ = roster_.size();
  stats_.nUnmetRequirements_ = 0;
  stats_.totalShortfall_ = 0;
  stats_.weightedShortfall_ = 0;
  for (const UnmetRequirement &unmet : unmetRequirements()) {
    stats_.nUnmetRequirements_++;
    stats_.totalShortfall_ += unmet.shortfall();
    stats_.weightedShortfall_ +=
        unmet.shortfall() * unmet.requirement.weightUnder;
  }
  stats_.timeTotal_ = timerSolve_.dSinceStart();

#ifdef SR_DEBUG
  if (!roster_.isConsistent())
    Tools::throwError("The indexes of the roster are not consistent.");
#endif

  return status_;
}
