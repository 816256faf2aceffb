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

#ifndef SRC_DATA_ROSTER_H_
#define SRC_DATA_ROSTER_H_

#include <string>
#include <vector>

#include "tools/Tools.h"

//-----------------------------------------------------------------------------
//
//  S t r u c t   A s s i g n m e n t
//
//  A staff member works a shift on a given day
//
//-----------------------------------------------------------------------------
struct Assignment {
  Assignment(int _staff, int _day, int _shift) :
      staff(_staff), day(_day), shift(_shift) {}

  bool operator==(const Assignment &a) const {
    return staff == a.staff && day == a.day && shift == a.shift;
  }

  int staff;
  int day;
  int shift;
};

//-----------------------------------------------------------------------------
//
//  C l a s s   R o s t e r
//
//  Set of the assignments of all the staff members. The assignments are only
//  appended: they are stored once in a flat vector and the other containers
//  index this vector.
//  - for each staff member, the assignments in their insertion order
//  - for each day and shift, the assignments covering the shift
//  - the number of shifts of each staff member on each day and of each type
//  assign() is the only way to modify these containers.
//
//-----------------------------------------------------------------------------
class Roster {
 public:
  Roster(int nStaff, int nDays, int nShifts);
  ~Roster() = default;

  // add an assignment and update all the indexes
  void assign(int staff, int day, int shift);

  int nStaff() const { return nStaff_; }
  int nDays() const { return nDays_; }
  int nShifts() const { return nShifts_; }

  // flat list of the assignments in their insertion order
  const std::vector<Assignment> &assignments() const { return assignments_; }
  const Assignment &assignment(int id) const { return assignments_.at(id); }
  int size() const { return static_cast<int>(assignments_.size()); }
  bool empty() const { return assignments_.empty(); }

  // indices in the flat list of the assignments of a staff member, in their
  // insertion order
  const std::vector<int> &staffAssignmentIds(int staff) const {
    return staffAssignments_.at(staff);
  }
  std::vector<Assignment> staffAssignments(int staff) const;
  int nAssignments(int staff) const {
    return static_cast<int>(staffAssignments_.at(staff).size());
  }

  // last assignment inserted for the staff member (nullptr if none)
  const Assignment *lastAssignment(int staff) const;

  // number of staff members assigned to a shift on a day
  int nAssigned(int day, int shift) const {
    if (day < 0 || day >= nDays_ || shift < 0 || shift >= nShifts_) return 0;
    return static_cast<int>(dayShiftAssignments_[day][shift].size());
  }

  // number of shifts worked by the staff member on the given day
  int nShiftsOnDay(int staff, int day) const {
    if (day < 0 || day >= nDays_) return 0;
    return nShiftsOnDay_.at(staff)[day];
  }
  bool isWorking(int staff, int day) const {
    return nShiftsOnDay(staff, day) > 0;
  }

  // number of assignments of the staff member to the given shift
  int nShiftAssignments(int staff, int shift) const {
    return nShiftAssignments_.at(staff).at(shift);
  }

  // check that the indexes match the flat list of assignments
  bool isConsistent() const;

  // one line per staff member with the shift of each day
  std::string toString(const std::vector<std::string> &staffNames,
                       const std::vector<std::string> &shiftNames) const;

 private:
  const int nStaff_, nDays_, nShifts_;

  std::vector<Assignment> assignments_;

  // per staff, ids of the assignments
  vector2D<int> staffAssignments_;

  // per day and shift, ids of the assignments
  vector3D<int> dayShiftAssignments_;

  // per staff and day, number of assignments
  vector2D<int> nShiftsOnDay_;

  // per staff and shift, number of assignments
  vector2D<int> nShiftAssignments_;
};

#endif  // SRC_DATA_ROSTER_H_
