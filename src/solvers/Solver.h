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

#ifndef SRC_SOLVERS_SOLVER_H_
#define SRC_SOLVERS_SOLVER_H_

#include <string>
#include <vector>

#include "Parameters.h"
#include "data/Roster.h"
#include "data/Scenario.h"
#include "solvers/GlobalStats.h"
#include "tools/Tools.h"

//-----------------------------------------------------------------------------
//
//  C l a s s   S t a t C t S t a f f
//
// The instances of this class gather the status of the constraints that relate
// to a staff member in a roster. Some of these constraints are not enforced
// when building the roster: they are only checked afterwards.
//
//-----------------------------------------------------------------------------

class StatCtStaff {
 public:
  // Constructor and destructor
  StatCtStaff() = default;
  ~StatCtStaff() = default;

  int staff_ = -1;

  // workload
  int nShifts_ = 0;
  int nMinutes_ = 0;
  int nWeekends_ = 0;

  // longest run of consecutive worked days
  int longestWorkRun_ = 0;

  // number of violations of each constraint
  int violTotalShifts_ = 0;
  int violMinTotalMinutes_ = 0;
  int violMaxTotalMinutes_ = 0;
  int violMinConsDaysWork_ = 0;  // worked runs that are too short
  int violMaxConsDaysWork_ = 0;  // worked runs that are too long
  int violMinConsDaysOff_ = 0;  // runs of days off that are too short
  int violTotalWeekends_ = 0;
  int violSuccShifts_ = 0;  // forbidden successive shifts

 public:
  int nViolations() const {
    return violTotalShifts_ + violMinTotalMinutes_ + violMaxTotalMinutes_ +
        violMinConsDaysWork_ + violMaxConsDaysWork_ + violMinConsDaysOff_ +
        violTotalWeekends_ + violSuccShifts_;
  }

  std::string toString() const;
};

// Cover requirement that is not met by a roster
//
struct UnmetRequirement {
  UnmetRequirement(const CoverRequirement &_requirement, int _assigned) :
      requirement(_requirement), assigned(_assigned) {}

  CoverRequirement requirement;
  int assigned;

  int shortfall() const { return requirement.required - assigned; }
};

//-----------------------------------------------------------------------------
//
//  C l a s s   S o l v e r
//
//  Solves the offline problem: from a given scenario, build a roster.
//  The solver owns its roster while the scenario is shared.
//
//-----------------------------------------------------------------------------

class Solver {
 public:
  // Specific constructor and destructor
  explicit Solver(PScenario pScenario, GreedyOptions options = GreedyOptions());
  virtual ~Solver() = default;

  // Main method to solve the rostering problem
  virtual Status solve() = 0;

 protected:
  //---------------------------------------------------------------------------
  // Inputs of the solver
  //---------------------------------------------------------------------------

  // Recall the "const" attributes as pointers : Scenario informations
  const PScenario pScenario_;

  // options of the solver
  GreedyOptions options_;

  //---------------------------------------------------------------------------
  // Outputs of the solver
  //---------------------------------------------------------------------------

  // Status of the solver
  Status status_ = UNSOLVED;

  // assignments of the staff members
  Roster roster_;

  // statistics of the last solve
  GlobalStats stats_;

 public:
  //---------------------------------------------------------------------------
  // Getters
  //---------------------------------------------------------------------------

  const PScenario &pScenario() const { return pScenario_; }
  const Scenario &scenario() const { return *pScenario_; }
  const GreedyOptions &options() const { return options_; }
  Status status() const { return status_; }
  const Roster &roster() const { return roster_; }
  const GlobalStats &stats() const { return stats_; }

  int nDays() const { return pScenario_->nDays(); }
  int nShifts() const { return pScenario_->nShifts(); }
  int nStaff() const { return pScenario_->nStaff(); }

  //---------------------------------------------------------------------------
  // Reporting on the roster
  //---------------------------------------------------------------------------

  // number of assignments of each staff member (indexed by staff)
  std::vector<int> nbAssignmentsPerStaff() const;

  // requirements of the scenario that are not covered, in the input order
  std::vector<UnmetRequirement> unmetRequirements() const;

  // one line per requirement with the number of staff assigned
  std::string coverageToString() const;

  // number of assignments of each staff member sorted by name (staff members
  // without assignment are skipped)
  std::string nbAssignmentsToString() const;

  // roster grid: one line per staff member and one column per day
  std::string solutionToLogString() const;

  // check all the constraints of the staff members in the roster
  std::vector<StatCtStaff> auditStaffConstraints() const;
  StatCtStaff auditStaffConstraints(int staff) const;
  std::string auditToString() const;

  // satisfied shift on requests and violated shift off requests
  std::string requestsToString() const;

  // write roster.txt and stat.txt in the given directory
  void writeSolution(const std::string &outdir) const;
};

#endif  // SRC_SOLVERS_SOLVER_H_
