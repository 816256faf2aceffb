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

#include <exception>
#include <iostream>
#include <memory>

#include "ParseArguments.h"
#include "solvers/InitializeSolver.h"

/******************************************************************************
* Main method
******************************************************************************/

int main(int argc, char **argv) {
  std::cout << "# BUILD A STAFF ROSTER WITH THE GREEDY" << std::endl;

  try {
    // Read the arguments and store them in pInputPaths
    std::unique_ptr<InputPaths> pInputPaths = readArguments(argc, argv);
    std::cout << pInputPaths->toString() << std::endl;

    // Solve the problem
    return solveGreedy(*pInputPaths);
  } catch (const std::exception &e) {
    std::cerr << "staffroster: " << e.what() << std::endl;
    std::cerr << "Usage: staffroster --instance <file> [--sol <dir>] "
                 "[--log <file>] [--param <file>] [--timeout <s>] "
                 "[--verbose <0|1|2>]" << std::endl;
    return 2;
  }
}
