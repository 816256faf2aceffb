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

#ifndef SRC_SOLVERS_INITIALIZESOLVER_H_
#define SRC_SOLVERS_INITIALIZESOLVER_H_

#include "tools/InputPaths.h"

// Build the roster of the instance with the greedy and print the reports.
// Return 0 if all the cover requirements are met, 1 otherwise.
// Input errors are thrown as Tools::SRException.
int solveGreedy(const InputPaths &inputPaths);

#endif  // SRC_SOLVERS_INITIALIZESOLVER_H_
