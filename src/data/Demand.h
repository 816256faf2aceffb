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

#ifndef SRC_DATA_DEMAND_H_
#define SRC_DATA_DEMAND_H_

#include <string>
#include <vector>

#include "tools/Tools.h"

//-----------------------------------------------------------------------------
//
// S t r u c t  C o v e r R e q u i r e m e n t
//
// Number of staff members required on a shift for a given day.
// The weights penalize the under and over coverage: only the weight for
// under coverage is used to prioritize the requirements.
//
//-----------------------------------------------------------------------------
struct CoverRequirement {
  CoverRequirement(int _num, int _day, int _shift, int _required,
                   int _weightUnder, int _weightOver) :
      num(_num), day(_day), shift(_shift), required(_required),
      weightUnder(_weightUnder), weightOver(_weightOver) {}

  // position of the requirement in the input
  int num;
  int day;
  int shift;
  int required;
  int weightUnder;
  int weightOver;

  std::string toString() const {
    return Tools::string("day %d, shift %d: %d staff (under=%d, over=%d)",
                         day, shift, required, weightUnder, weightOver);
  }
};

#endif  // SRC_DATA_DEMAND_H_
