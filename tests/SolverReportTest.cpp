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

#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "TestUtils.h"
#include "solvers/Solver.h"

using std::string;
using std::vector;

namespace {

// solver that only copies a given list of assignments in its roster
class FixedSolver : public Solver {
 public:
  FixedSolver(PScenario pScenario, vector<Assignment> assignments) :
      Solver(std::move(pScenario)), assignments_(std::move(assignments)) {}

  Status solve() override {
    for (const Assignment &a : assignments_)
      roster_.assign(a.staff, a.day, a.shift);
    status_ = unmetRequirements().empty() ? FEASIBLE : INFEASIBLE;
    stats_.status_ = status_;
    stats_.nAssignments_ = roster_.size();
    return status_;
  }

 private:
  vector<Assignment> assignments_;
};

// two weeks, shifts D and N (N cannot be followed by D) and three staff
// members: S1 is constrained, A0 and B2 are not
PScenario auditScenario() {
  vector<PShift> pShifts = {test::makeShift("D", 0),
                            test::makeShift("N", 1, {0}, 600)};
  vector<PStaffMember> pStaff = {
      std::make_shared<StaffMember>(0, "S1", vector<int>(2, NO_LIMIT), 5, 3000,
                                    4000, 2, 3, 2, 1),
      test::makeStaff(1, "A0", 2, 14),
      test::makeStaff(2, "B2", 2, 14)};
  vector<ShiftRequest> on = {ShiftRequest(0, 0, 1, 3), ShiftRequest(0, 2, 0, 2)};
  vector<ShiftRequest> off = {ShiftRequest(0, 4, 0, 5)};
  vector<CoverRequirement> cover = {CoverRequirement(0, 0, 1, 1, 10, 1),
                                    CoverRequirement(1, 2, 0, 2, 7, 1)};
  return std::make_shared<const Scenario>("audit", 14, pShifts, pStaff,
                                          vector2D<int>(), on, off, cover);
}

// S1: N on day 0, D on days 1, 4 to 7 and 9; A0: D on day 10
vector<Assignment> auditAssignments() {
  return {Assignment(0, 0, 1), Assignment(0, 1, 0), Assignment(0, 4, 0),
          Assignment(0, 5, 0), Assignment(0, 6, 0), Assignment(0, 7, 0),
          Assignment(0, 9, 0), Assignment(1, 10, 0)};
}

string readFile(const string &path) {
  std::ifstream file(path.c_str());
  std::stringstream content;
  content << file.rdbuf();
  return content.str();
}

}  // namespace

TEST(SolverReportTest, AuditCountsTheViolations) {
  FixedSolver solver(auditScenario(), auditAssignments());
  solver.solve();

  StatCtStaff stat = solver.auditStaffConstraints(0);
  EXPECT_EQ(stat.staff_, 0);
  EXPECT_EQ(stat.nShifts_, 7);
  EXPECT_EQ(stat.nMinutes_, 600 + 6 * 480);
  EXPECT_EQ(stat.nWeekends_, 1);
  EXPECT_EQ(stat.longestWorkRun_, 4);

  EXPECT_EQ(stat.violTotalShifts_, 1);
  EXPECT_EQ(stat.violMinTotalMinutes_, 0);
  EXPECT_EQ(stat.violMaxTotalMinutes_, 0);
  EXPECT_EQ(stat.violMinConsDaysWork_, 1);  // day 9 alone
  EXPECT_EQ(stat.violMaxConsDaysWork_, 1);  // days 4 to 7
  EXPECT_EQ(stat.violMinConsDaysOff_, 1);   // day 8 alone
  EXPECT_EQ(stat.violTotalWeekends_, 0);
  EXPECT_EQ(stat.violSuccShifts_, 1);       // N then D on days 0-1
  EXPECT_EQ(stat.nViolations(), 5);

  string str = stat.toString();
  EXPECT_NE(str.find("totalShifts"), string::npos);
  EXPECT_NE(str.find("maxConsecutiveShifts(x1)"), string::npos);
  EXPECT_NE(str.find("forbiddenSuccessions(x1)"), string::npos);
  EXPECT_EQ(str.find(" ok"), string::npos);
}

TEST(SolverReportTest, AuditOfTotalsAndWeekends) {
  // S1 works one shift on each weekend
  FixedSolver solver(auditScenario(),
                     {Assignment(0, 5, 0), Assignment(0, 13, 0)});
  solver.solve();

  StatCtStaff stat = solver.auditStaffConstraints(0);
  EXPECT_EQ(stat.nWeekends_, 2);
  EXPECT_EQ(stat.violTotalWeekends_, 1);
  EXPECT_EQ(stat.violMinTotalMinutes_, 1);
  EXPECT_EQ(stat.violMinConsDaysWork_, 2);
  // the days off between the two shifts are long enough and the other runs
  // of days off touch the border of the horizon
  EXPECT_EQ(stat.violMinConsDaysOff_, 0);
}

TEST(SolverReportTest, StaffWithoutViolationIsOk) {
  FixedSolver solver(auditScenario(), auditAssignments());
  solver.solve();

  vector<StatCtStaff> stats = solver.auditStaffConstraints();
  ASSERT_EQ(stats.size(), 3u);
  EXPECT_EQ(stats[1].nViolations(), 0);
  EXPECT_NE(stats[1].toString().find(" ok"), string::npos);
  EXPECT_EQ(stats[2].nShifts_, 0);
  EXPECT_EQ(stats[2].nViolations(), 0);

  string str = solver.auditToString();
  EXPECT_NE(str.find("S1: "), string::npos);
  EXPECT_NE(str.find("Total number of violations: 5"), string::npos);
}

TEST(SolverReportTest, UnmetRequirementsAndCoverage) {
  FixedSolver solver(auditScenario(), auditAssignments());
  EXPECT_EQ(solver.solve(), INFEASIBLE);

  vector<UnmetRequirement> unmet = solver.unmetRequirements();
  ASSERT_EQ(unmet.size(), 1u);
  EXPECT_EQ(unmet[0].requirement.num, 1);
  EXPECT_EQ(unmet[0].assigned, 0);
  EXPECT_EQ(unmet[0].shortfall(), 2);

  string str = solver.coverageToString();
  EXPECT_NE(str.find("# COVERAGE"), string::npos);
  EXPECT_NE(str.find("missing 2 (weight 7)"), string::npos);
  EXPECT_EQ(str.find("missing 1"), string::npos);
}

TEST(SolverReportTest, AssignmentsAreSortedByName) {
  FixedSolver solver(auditScenario(), auditAssignments());
  solver.solve();
  EXPECT_EQ(solver.nbAssignmentsPerStaff(), (vector<int>{7, 1, 0}));
  EXPECT_EQ(solver.nbAssignmentsToString(),
            "A0: 1 assignments\nS1: 7 assignments\n");
}

TEST(SolverReportTest, RequestsAreCounted) {
  FixedSolver solver(auditScenario(), auditAssignments());
  solver.solve();
  string str = solver.requestsToString();
  EXPECT_NE(str.find("Shift on requests satisfied : 1/2 (weight 3)"),
            string::npos);
  EXPECT_NE(str.find("Shift off requests violated : 1/1 (weight 5)"),
            string::npos);
}

TEST(SolverReportTest, WriteSolution) {
  FixedSolver solver(auditScenario(), auditAssignments());
  solver.solve();
  string outdir = ::testing::TempDir() + "staffroster_solution/run";
  solver.writeSolution(outdir);

  string roster = readFile(outdir + "/roster.txt");
  EXPECT_NE(roster.find("S1"), string::npos);
  EXPECT_NE(roster.find("A0"), string::npos);
  string stat = readFile(outdir + "/stat.txt");
  EXPECT_NE(stat.find("status=INFEASIBLE"), string::npos);
  EXPECT_NE(stat.find("assignments=8"), string::npos);
  EXPECT_NE(stat.find("requirements=2"), string::npos);

  // a new solution replaces the previous one
  solver.writeSolution(outdir);
  EXPECT_EQ(readFile(outdir + "/stat.txt"), stat);
}

TEST(SolverReportTest, WeekendsOfAnIncompleteWeek) {
  // 13 days: the second weekend only has its saturday (day 12)
  PScenario pScenario = test::makeSingleStaffScenario(13, 13, {});
  FixedSolver solver(pScenario, {Assignment(0, 5, 0), Assignment(0, 6, 0),
                                 Assignment(0, 12, 0)});
  solver.solve();
  EXPECT_EQ(solver.auditStaffConstraints(0).nWeekends_, 2);

  FixedSolver weekdays(pScenario, {Assignment(0, 0, 0), Assignment(0, 4, 0),
                                   Assignment(0, 7, 0)});
  weekdays.solve();
  EXPECT_EQ(weekdays.auditStaffConstraints(0).nWeekends_, 0);
}

TEST(GlobalStatsTest, ToString) {
  FixedSolver solver(auditScenario(), auditAssignments());
  solver.solve();
  GlobalStats stats = solver.stats();
  stats.totalShortfall_ = 2;
  stats.timeTotal_ = 1.5;

  string str = stats.toString();
  EXPECT_NE(str.find("status=INFEASIBLE"), string::npos);
  EXPECT_NE(str.find("assignments=8"), string::npos);
  EXPECT_NE(str.find("requirements=2"), string::npos);
  EXPECT_NE(str.find("totalShortfall=2"), string::npos);
  EXPECT_NE(str.find("timeTotal=1.500"), string::npos);
}
