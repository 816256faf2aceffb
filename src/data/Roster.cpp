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

#include "data/Roster.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>

using std::string;
using std::vector;

Roster::Roster(int nStaff, int nDays, int nShifts) :
    nStaff_(nStaff), nDays_(nDays), nShifts_(nShifts) {
  staffAssignments_.resize(nStaff_);
  dayShiftAssignments_.resize(nDays_);
  for (vector2D<int> &v : dayShiftAssignments_) v.resize(nShifts_);
  Tools::initVector2D(&nShiftsOnDay_, nStaff_, nDays_, 0);
  Tools::initVector2D(&nShiftAssignments_, nStaff_, nShifts_, 0);
}

// assign a task at on a given day
//
void Roster::assign(int staff, int day, int shift) {
  if (staff < 0 || staff >= nStaff_ || day < 0 || day >= nDays_
      || shift < 0 || shift >= nShifts_)
    Tools::throwError("Cannot assign staff %d to shift %d on day %d: the "
                      "roster has %d staff, %d days and %d shifts.",
                      staff, shift, day, nStaff_, nDays_, nShifts_);

  int id = static_cast<int>(assignments_.size());
  assignments_.emplace_back(staff, day, shift);
  staffAssignments_[staff].push_back(id);
  dayShiftAssignments_[day][shift].push_back(id);
  nShiftsOnDay_[staff][day]++;
  nShiftAssignments_[staff][shift]++;
}

vector<Assignment> Roster::staffAssignments(int staff) const {
  vector<Assignment> staffAssignments;
  for (int id : staffAssignments_.at(staff))
    staffAssignments.push_back(assignments_[id]);
  return staffAssignments;
}

const Assignment *Roster::lastAssignment(int staff) const {
  const vector<int> &ids = staffAssignments_.at(staff);
  if (ids.empty()) return nullptr;
  return &assignments_[ids.back()];
}

bool Roster::isConsistent() const {
  // each assignment must appear exactly once in each index
  vector<int> nInStaff(assignments_.size(), 0),
      nInDayShift(assignments_.size(), 0);
  for (int n = 0; n < nStaff_; ++n)
    for (int id : staffAssignments_[n]) {
      if (id < 0 || id >= size() || assignments_[id].staff != n) return false;
      nInStaff[id]++;
    }
  for (int d = 0; d < nDays_; ++d)
    for (int s = 0; s < nShifts_; ++s)
      for (int id : dayShiftAssignments_[d][s]) {
        if (id < 0 || id >= size()) return false;
        const Assignment &a = assignments_[id];
        if (a.day != d || a.shift != s) return false;
        nInDayShift[id]++;
      }
  for (size_t id = 0; id < assignments_.size(); ++id)
    if (nInStaff[id] != 1 || nInDayShift[id] != 1) return false;

  // the counters must match the flat list
  vector2D<int> nOnDay, nOfShift;
  Tools::initVector2D(&nOnDay, nStaff_, nDays_, 0);
  Tools::initVector2D(&nOfShift, nStaff_, nShifts_, 0);
  for (const Assignment &a : assignments_) {
    nOnDay[a.staff][a.day]++;
    nOfShift[a.staff][a.shift]++;
  }
  return nOnDay == nShiftsOnDay_ && nOfShift == nShiftAssignments_;
}

string Roster::toString(const vector<string> &staffNames,
                        const vector<string> &shiftNames) const {
  std::stringstream rep;
  size_t width = 0;
  for (const string &name : staffNames) width = std::max(width, name.size());

  // header with the days
  rep << std::left << std::setw(width) << "" << " |";
  for (int d = 0; d < nDays_; ++d)
    rep << std::setw(SHIFT_PAD) << d << "|";
  rep << std::endl;

  // one line per staff member
  for (int n = 0; n < nStaff_; ++n) {
    vector<string> shifts(nDays_, REST_DISPLAY);
    for (int id : staffAssignments_[n]) {
      const Assignment &a = assignments_[id];
      string &str = shifts[a.day];
      if (str == REST_DISPLAY)
        str = shiftNames.at(a.shift);
      else
        str += "+" + shiftNames.at(a.shift);
    }
    rep << std::setw(width) << staffNames.at(n) << " |";
    for (const string &str : shifts)
      rep << std::setw(SHIFT_PAD) << str << "|";
    rep << std::endl;
  }
  return rep.str();
}
