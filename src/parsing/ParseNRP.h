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

#ifndef SRC_PARSING_PARSENRP_H_
#define SRC_PARSING_PARSENRP_H_

#include <string>

#include "tools/Tools.h"
#include "data/Scenario.h"

// Read an instance of the NRP benchmark (sections SECTION_HORIZON,
// SECTION_SHIFTS, SECTION_STAFF, SECTION_DAYS_OFF, SECTION_SHIFT_ON_REQUESTS,
// SECTION_SHIFT_OFF_REQUESTS and SECTION_COVER)
// Throw a Tools::SRException if the file is not as expected
PScenario readNRPInstance(const std::string &fileName);

#endif  // SRC_PARSING_PARSENRP_H_
