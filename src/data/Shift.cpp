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

#include "data/Shift.h"

#include <sstream>
#include <string>

std::string Shift::toString() const {
  std::stringstream rep;
  rep << "# " << name << " (" << id << "): " << duration << " min,"
      << " forbidden successors:";
  if (forbiddenSuccessors.empty()) rep << " none";
  for (int s : forbiddenSuccessors) rep << " " << s;
  return rep.str();
}
