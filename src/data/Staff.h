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

#ifndef SRC_DATA_STAFF_H_
#define SRC_DATA_STAFF_H_

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tools/Tools.h"

// value of a limit that is not set for a staff member
static const int NO_LIMIT = -1;

class StaffMember;
typedef std::shared_ptr<const StaffMember> PStaffMember;

//-----------------------------------------------------------------------------
//
//  C l a s s   S t a f f M e m b e r
//
//  A staff member and the limits of the contract.
//  Only the shift limits and the maximum number of consecutive days worked are
//  enforced by the greedy. The other limits are kept to be audited.
//
//-----------------------------------------------------------------------------
class StaffMember {
 public:
  // Index of the staff member in the scenario
  const int num_;

  // Name (identifier in the instance file)
  const std::string name_;

  // Maximum number of assignments of each shift, indexed by shift id
  // (NO_LIMIT if the shift is uncapped)
  const std::vector<int> maxShifts_;

  // Maximum total number of shifts over the horizon (NO_LIMIT if absent)
  const int maxTotalShifts_;

  // Minimum and maximum total duration worked over the horizon, in minutes
  const int minTotalMinutes_, maxTotalMinutes_;

  // Minimum and maximum number of consecutive days worked
  const int minConsDaysWork_, maxConsDaysWork_;

  // Minimum number of consecutive days off
  const int minConsDaysOff_;

  // Maximum number of worked weekends (NO_LIMIT if absent)
  const int maxTotalWeekends_;

  // Constructor and Destructor
  //
  StaffMember(int num,
              std::string name,
              std::vector<int> maxShifts,
              int maxTotalShifts,
              int minTotalMinutes,
              int maxTotalMinutes,
              int minConsDaysWork,
              int maxConsDaysWork,
              int minConsDaysOff,
              int maxTotalWeekends = NO_LIMIT) :
      num_(num),
      name_(std::move(name)),
      maxShifts_(std::move(maxShifts)),
      maxTotalShifts_(maxTotalShifts),
      minTotalMinutes_(minTotalMinutes),
      maxTotalMinutes_(maxTotalMinutes),
      minConsDaysWork_(minConsDaysWork),
      maxConsDaysWork_(maxConsDaysWork),
      minConsDaysOff_(minConsDaysOff),
      maxTotalWeekends_(maxTotalWeekends) {}

  // basic getters
  //
  bool hasShiftLimit(int shift) const {
    return maxShifts_.at(shift) != NO_LIMIT;
  }
  int maxShifts(int shift) const { return maxShifts_.at(shift); }
  bool hasMaxTotalShifts() const { return maxTotalShifts_ != NO_LIMIT; }
  bool hasMaxTotalWeekends() const { return maxTotalWeekends_ != NO_LIMIT; }

  // Display methods: toString + override operator<< (easier)
  //
  std::string toString() const;
  friend std::ostream &operator<<(std::ostream &outs,
                                  const StaffMember &staff) {
    return outs << staff.toString();
  }
};

#endif  // SRC_DATA_STAFF_H_
