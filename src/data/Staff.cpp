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

#include "data/Staff.h"

#include <sstream>
#include <string>

std::string StaffMember::toString() const {
  std::stringstream rep;
  rep << "# " << name_ << " (" << num_ << ")" << std::endl;
  rep << "#\t" << "Shift limits       :";
  for (size_t s = 0; s < maxShifts_.size(); ++s)
    if (maxShifts_[s] != NO_LIMIT)
      rep << " " << s << "=" << maxShifts_[s];
  rep << std::endl;
  rep << "#\t" << "Total shifts       : ";
  if (hasMaxTotalShifts())
    rep << "<= " << maxTotalShifts_;
  else
    rep << "-";
  rep << std::endl;
  rep << "#\t" << "Total minutes      : " << minTotalMinutes_ << " < "
      << maxTotalMinutes_ << std::endl;
  rep << "#\t" << "Cons. days worked  : " << minConsDaysWork_ << " < "
      << maxConsDaysWork_ << std::endl;
  rep << "#\t" << "Cons. days off     : >= " << minConsDaysOff_ << std::endl;
  rep << "#\t" << "Worked weekends    : ";
  if (hasMaxTotalWeekends())
    rep << "<= " << maxTotalWeekends_;
  else
    rep << "-";
  rep << std::endl;
  return rep.str();
}
