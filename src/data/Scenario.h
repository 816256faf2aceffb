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

#ifndef SRC_DATA_SCENARIO_H_
#define SRC_DATA_SCENARIO_H_

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "tools/Tools.h"
#include "data/Demand.h"
#include "data/Shift.h"
#include "data/Staff.h"

class Scenario;
typedef std::shared_ptr<const Scenario> PScenario;

//-----------------------------------------------------------------------------
//
//  S t r u c t   S h i f t R e q u e s t
//
//  Wish of a staff member to work (shift on) or not to work (shift off) a
//  given shift on a given day. The requests are not used by the greedy, they
//  are only reported.
//
//-----------------------------------------------------------------------------
struct ShiftRequest {
  ShiftRequest(int _staff, int _day, int _shift, int _weight) :
      staff(_staff), day(_day), shift(_shift), weight(_weight) {}

  int staff;
  int day;
  int shift;
  int weight;
};

//-----------------------------------------------------------------------------
//
//  C l a s s   S c e n a r i o
//
//  Static description of the instance: it is built once by the parser and
//  never modified afterwards, so it can be shared between several solvers.
//
//-----------------------------------------------------------------------------
class Scenario {
 public:
  // Constructor and destructor
  //
  Scenario(std::string name,
           int nDays,
           std::vector<PShift> pShifts,
           std::vector<PStaffMember> pStaff,
           const vector2D<int> &daysOff,
           std::vector<ShiftRequest> shiftOnRequests,
           std::vector<ShiftRequest> shiftOffRequests,
           std::vector<CoverRequirement> coverRequirements);
  ~Scenario() = default;

  // name of the instance
  //
  const std::string name_;

 private:
  // number of days in the horizon
  const int nDays_;

  // shifts and staff members, in the order of the input file
  std::vector<PShift> pShifts_;
  std::vector<PStaffMember> pStaff_;

  // correspondence between names and indices
  std::map<std::string, int> shiftToInt_, staffToInt_;

  // days off of each staff member
  std::vector<std::set<int>> daysOff_;
  vector2D<bool> isDayOff_;

  // preferences
  std::vector<ShiftRequest> shiftOnRequests_, shiftOffRequests_;

  // coverage requirements, in the order of the input file
  std::vector<CoverRequirement> coverRequirements_;

 public:
  // getters for the class attributes
  //
  int nDays() const { return nDays_; }
  int nShifts() const { return static_cast<int>(pShifts_.size()); }
  int nStaff() const { return static_cast<int>(pStaff_.size()); }

  const std::vector<PShift> &pShifts() const { return pShifts_; }
  const PShift &pShift(int s) const { return pShifts_.at(s); }
  const Shift &shift(int s) const { return *pShifts_.at(s); }
  const std::string &shiftName(int s) const { return pShifts_.at(s)->name; }
  int shiftDuration(int s) const { return pShifts_.at(s)->duration; }

  const std::vector<PStaffMember> &pStaff() const { return pStaff_; }
  const PStaffMember &pStaff(int n) const { return pStaff_.at(n); }
  const StaffMember &staff(int n) const { return *pStaff_.at(n); }
  const std::string &staffName(int n) const { return pStaff_.at(n)->name_; }

  // return the index of the given shift or staff member, throw if unknown
  int shiftId(const std::string &name) const;
  int staffId(const std::string &name) const;

  // true if the successor shift is forbidden the day after the shift
  bool isForbiddenSuccessor(int shift, int successor) const {
    return pShifts_.at(shift)->forbids(successor);
  }

  const std::set<int> &daysOff(int n) const { return daysOff_.at(n); }
  bool isDayOff(int n, int day) const {
    if (day < 0 || day >= nDays_) return daysOff_.at(n).count(day) > 0;
    return isDayOff_[n][day];
  }

  const std::vector<ShiftRequest> &shiftOnRequests() const {
    return shiftOnRequests_;
  }
  const std::vector<ShiftRequest> &shiftOffRequests() const {
    return shiftOffRequests_;
  }

  const std::vector<CoverRequirement> &coverRequirements() const {
    return coverRequirements_;
  }
  int nCoverRequirements() const {
    return static_cast<int>(coverRequirements_.size());
  }

  // Display methods: toString
  //
  std::string toString() const;
};

#endif  // SRC_DATA_SCENARIO_H_
