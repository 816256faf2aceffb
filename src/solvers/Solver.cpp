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

#include "solvers/Solver.h"

#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <utility>

using std::string;
using std::vector;

//-----------------------------------------------------------------------------
//
//  C l a s s   S t a t C t S t a f f
//
//-----------------------------------------------------------------------------

string StatCtStaff::toString() const {
  std::stringstream rep;
  rep << "shifts=" << nShifts_ << " minutes=" << nMinutes_
      << " weekends=" << nWeekends_ << " longestRun=" << longestWorkRun_;
  if (nViolations() == 0) {
    rep << " ok";
    return rep.str();
  }
  rep << " violations:";
  if (violTotalShifts_) rep << " totalShifts";
  if (violMinTotalMinutes_) rep << " minTotalMinutes";
  if (violMaxTotalMinutes_) rep << " maxTotalMinutes";
  if (violMinConsDaysWork_)
    rep << " minConsecutiveShifts(x" << violMinConsDaysWork_ << ")";
  if (violMaxConsDaysWork_)
    rep << " maxConsecutiveShifts(x" << violMaxConsDaysWork_ << ")";
  if (violMinConsDaysOff_)
    rep << " minConsecutiveDaysOff(x" << violMinConsDaysOff_ << ")";
  if (violTotalWeekends_) rep << " maxWeekends";
  if (violSuccShifts_)
    rep << " forbiddenSuccessions(x" << violSuccShifts_ << ")";
  return rep.str();
}

//-----------------------------------------------------------------------------
//
//  C l a s s   S o l v e r
//
//  Solves the offline problem
//  From a given scenario, can compute a roster
//
//-----------------------------------------------------------------------------

Solver::Solver(PScenario pScenario, GreedyOptions options) :
    pScenario_(std::move(pScenario)),
    options_(std::move(options)),
    roster_(pScenario_->nStaff(), pScenario_->nDays(), pScenario_->nShifts()) {
  stats_.nRequirements_ = pScenario_->nCoverRequirements();
}

vector<int> Solver::nbAssignmentsPerStaff() const {
  vector<int> nbAssignments;
  for (int n = 0; n < nStaff(); ++n)
    nbAssignments.push_back(roster_.nAssignments(n));
  return nbAssignments;
}

vector<UnmetRequirement> Solver::unmetRequirements() const {
  vector<UnmetRequirement> unmet;
  for (const CoverRequirement &req : pScenario_->coverRequirements()) {
    int assigned = roster_.nAssigned(req.day, req.shift);
    if (assigned < req.required) unmet.emplace_back(req, assigned);
  }
  return unmet;
}

string Solver::coverageToString() const {
  std::stringstream rep;
  rep << "# COVERAGE" << std::endl;
  for (const CoverRequirement &req : pScenario_->coverRequirements()) {
    int assigned = roster_.nAssigned(req.day, req.shift);
    rep << Tools::string("day %3d  %-*s required=%-3d assigned=%-3d",
                         req.day, SHIFT_PAD,
                         pScenario_->shiftName(req.shift).c_str(),
                         req.required, assigned);
    if (assigned < req.required)
      rep << "  missing " << req.required - assigned
          << " (weight " << req.weightUnder << ")";
    rep << std::endl;
  }
  return rep.str();
}

string Solver::nbAssignmentsToString() const {
  std::map<string, int> nbAssignmentsByName;
  for (int n = 0; n < nStaff(); ++n)
    if (roster_.nAssignments(n) > 0)
      nbAssignmentsByName[pScenario_->staffName(n)] = roster_.nAssignments(n);

  std::stringstream rep;
  for (const auto &p : nbAssignmentsByName)
    rep << p.first << ": " << p.second << " assignments" << std::endl;
  return rep.str();
}

string Solver::solutionToLogString() const {
  vector<string> staffNames, shiftNames;
  for (const PStaffMember &pStaff : pScenario_->pStaff())
    staffNames.push_back(pStaff->name_);
  for (const PShift &pShift : pScenario_->pShifts())
    shiftNames.push_back(pShift->name);
  return roster_.toString(staffNames, shiftNames);
}

StatCtStaff Solver::auditStaffConstraints(int staff) const {
  const StaffMember &member = pScenario_->staff(staff);
  StatCtStaff stat;
  stat.staff_ = staff;

  // shifts worked each day
  vector2D<int> shiftsOnDay(nDays());
  for (int id : roster_.staffAssignmentIds(staff)) {
    const Assignment &a = roster_.assignment(id);
    shiftsOnDay[a.day].push_back(a.shift);
    stat.nShifts_++;
    stat.nMinutes_ += pScenario_->shiftDuration(a.shift);
  }

  // totals
  if (member.hasMaxTotalShifts() && stat.nShifts_ > member.maxTotalShifts_)
    stat.violTotalShifts_ = 1;
  if (stat.nMinutes_ < member.minTotalMinutes_) stat.violMinTotalMinutes_ = 1;
  if (stat.nMinutes_ > member.maxTotalMinutes_) stat.violMaxTotalMinutes_ = 1;

  // weekends: a weekend is worked if one of its days is worked
  vector<bool> isWeekendWorked(Tools::weekOf(nDays() - 1) + 1, false);
  for (int d = 0; d < nDays(); ++d)
    if ((Tools::isSaturday(d) || Tools::isSunday(d)) &&
        roster_.isWorking(staff, d))
      isWeekendWorked[Tools::weekOf(d)] = true;
  stat.nWeekends_ = static_cast<int>(
      std::count(isWeekendWorked.begin(), isWeekendWorked.end(), true));
  if (member.hasMaxTotalWeekends() &&
      stat.nWeekends_ > member.maxTotalWeekends_)
    stat.violTotalWeekends_ = 1;

  // runs of worked days and of days off
  // the runs of days off that touch the border of the horizon are not checked
  int day = 0;
  bool hasWorked = false;
  while (day < nDays()) {
    bool working = roster_.isWorking(staff, day);
    int length = 0;
    while (day < nDays() && roster_.isWorking(staff, day) == working) {
      ++length;
      ++day;
    }
    if (working) {
      hasWorked = true;
      stat.longestWorkRun_ = std::max(stat.longestWorkRun_, length);
      if (length < member.minConsDaysWork_) stat.violMinConsDaysWork_++;
      if (length > member.maxConsDaysWork_) stat.violMaxConsDaysWork_++;
    } else if (hasWorked && day < nDays() &&
               length < member.minConsDaysOff_) {
      stat.violMinConsDaysOff_++;
    }
  }

  // forbidden successions
  for (int d = 0; d + 1 < nDays(); ++d)
    for (int s : shiftsOnDay[d])
      for (int succ : shiftsOnDay[d + 1])
        if (pScenario_->isForbiddenSuccessor(s, succ))
          stat.violSuccShifts_++;

  return stat;
}

vector<StatCtStaff> Solver::auditStaffConstraints() const {
  vector<StatCtStaff> stats;
  for (int n = 0; n < nStaff(); ++n)
    stats.push_back(auditStaffConstraints(n));
  return stats;
}

string Solver::auditToString() const {
  std::stringstream rep;
  rep << "# STAFF CONSTRAINTS" << std::endl;
  int nViolations = 0;
  for (const StatCtStaff &stat : auditStaffConstraints()) {
    rep << pScenario_->staffName(stat.staff_) << ": " << stat.toString()
        << std::endl;
    nViolations += stat.nViolations();
  }
  rep << "Total number of violations: " << nViolations << std::endl;
  return rep.str();
}

string Solver::requestsToString() const {
  auto isAssigned = [this](const ShiftRequest &request) {
    for (int id : roster_.staffAssignmentIds(request.staff)) {
      const Assignment &a = roster_.assignment(id);
      if (a.day == request.day && a.shift == request.shift) return true;
    }
    return false;
  };

  int nOn = 0, weightOn = 0, nOff = 0, weightOff = 0;
  for (const ShiftRequest &request : pScenario_->shiftOnRequests())
    if (isAssigned(request)) {
      nOn++;
      weightOn += request.weight;
    }
  for (const ShiftRequest &request : pScenario_->shiftOffRequests())
    if (isAssigned(request)) {
      nOff++;
      weightOff += request.weight;
    }

  std::stringstream rep;
  rep << "# REQUESTS" << std::endl;
  rep << "Shift on requests satisfied : " << nOn << "/"
      << pScenario_->shiftOnRequests().size() << " (weight " << weightOn
      << ")" << std::endl;
  rep << "Shift off requests violated : " << nOff << "/"
      << pScenario_->shiftOffRequests().size() << " (weight " << weightOff
      << ")" << std::endl;
  return rep.str();
}

void Solver::writeSolution(const string &outdir) const {
  Tools::mkdirs(outdir);
  Tools::LogOutput rosterLog(outdir + "/roster.txt", false);
  rosterLog << solutionToLogString();
  Tools::LogOutput statLog(outdir + "/stat.txt", false);
  statLog << stats_.toString();
}
