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

#ifndef SRC_DATA_SHIFT_H_
#define SRC_DATA_SHIFT_H_

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tools/Tools.h"

struct Shift;
typedef std::shared_ptr<const Shift> PShift;

//-----------------------------------------------------------------------------
//
//  S t r u c t   S h i f t
//
//  A work shift of the instance: the shifts that cannot be worked on the day
//  after this one are given by their index
//
//-----------------------------------------------------------------------------
struct Shift {
  Shift(std::string _name, int _id, int _duration,
        std::vector<int> _forbiddenSuccessors) :
      name(std::move(_name)),
      id(_id),
      duration(_duration),
      forbiddenSuccessors(std::move(_forbiddenSuccessors)) {
    std::sort(forbiddenSuccessors.begin(), forbiddenSuccessors.end());
  }

  // true if the shift succId is not allowed on the day after this shift
  bool forbids(int succId) const {
    return std::binary_search(forbiddenSuccessors.begin(),
                              forbiddenSuccessors.end(), succId);
  }
  std::string toString() const;

  const std::string name;
  const int id;
  // length of the shift in minutes
  const int duration;
  std::vector<int> forbiddenSuccessors;
};

#endif  // SRC_DATA_SHIFT_H_
