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

#include "solvers/InitializeSolver.h"

#include <iomanip>
#include <iostream>
#include <string>

#include "Parameters.h"
#include "parsing/ParseNRP.h"
#include "solvers/Greedy.h"
#include "tools/Tools.h"

int solveGreedy(const InputPaths &inputPaths) {
  // read the options: the command line overrides the options file
  GreedyOptions options;
  if (!inputPaths.paramFile().empty()) options.read(inputPaths.paramFile());
  if (!inputPaths.logPath().empty()) options.logfile_ = inputPaths.logPath();
  if (inputPaths.timeOut() > 0)
    options.maxSolvingTimeSeconds_ = inputPaths.timeOut();
  if (inputPaths.verbose() >= 0) options.verbose_ = inputPaths.verbose();

  // set the scenario
  std::cout << "# INITIALIZE THE SCENARIO: " << inputPaths.instance()
            << std::endl;
  PScenario pScenario = readNRPInstance(inputPaths.instance());
  std::cout << "Horizon: " << pScenario->nDays() << " days" << std::endl;
  std::cout << "Number of shifts: " << pScenario->nShifts() << std::endl;
  std::cout << "Number of staff: " << pScenario->nStaff() << std::endl;
  std::cout << "Number of shift on requests: "
            << pScenario->shiftOnRequests().size() << std::endl;
  std::cout << "Number of shift off requests: "
            << pScenario->shiftOffRequests().size() << std::endl;
  std::cout << "Number of cover requirements: "
            << pScenario->nCoverRequirements() << std::endl;
  if (options.verbose_ >= 2) std::cout << pScenario->toString();
  std::cout << std::endl;

  // build the roster
  //
  std::cout << "# SOLVE THE INSTANCE" << std::endl;
  Greedy greedy(pScenario, options);
  Status status = greedy.solve();

  if (status == FEASIBLE)
    std::cout << "Successfully created a schedule!" << std::endl;
  else
    std::cout << "Failed to create a complete schedule." << std::endl;
  std::cout << "Total assignments made: " << greedy.roster().size()
            << std::endl;
  std::cout << std::endl << "Assignments per staff member:" << std::endl;
  std::cout << greedy.nbAssignmentsToString() << std::endl;

  // Display the details of the solution
  //
  if (options.verbose_ >= 1) {
    std::cout << "# FINAL SOLUTION" << std::endl;
    std::cout << greedy.coverageToString() << std::endl;
    std::cout << greedy.solutionToLogString() << std::endl;
    std::cout << greedy.auditToString() << std::endl;
    std::cout << greedy.requestsToString() << std::endl;
  }
  std::cout << "# Solution status = " << statusToString.at(status)
            << std::endl;
  std::cout << "# Running time = " << std::setprecision(3) << std::fixed
            << greedy.stats().timeTotal_ << " sec." << std::endl;

  // Write the roster and the final statistics
  if (!inputPaths.solutionPath().empty())
    greedy.writeSolution(inputPaths.solutionPath());

  // 1 if the roster is not complete, 0 otherwise
  return status == FEASIBLE ? 0 : 1;
}
