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

#include <string>
#include <vector>

#include "TestUtils.h"
#include "data/Roster.h"
#include "data/Scenario.h"

using std::string;
using std::vector;

//-----------------------------------------------------------------------------
// Roster
//-----------------------------------------------------------------------------

TEST(RosterTest, AssignUpdatesAllTheIndexes) {
  Roster roster(2, 3, 2);
  EXPECT_TRUE(roster.empty());
  EXPECT_EQ(roster.lastAssignment(0), nullptr);

  roster.assign(0, 1, 1);
  roster.assign(1, 1, 1);
  roster.assign(0, 0, 0);

  EXPECT_EQ(roster.size(), 3);
  EXPECT_EQ(roster.nAssignments(0), 2);
  EXPECT_EQ(roster.nAssignments(1), 1);
  EXPECT_EQ(roster.nAssigned(1, 1), 2);
  EXPECT_EQ(roster.nAssigned(0, 0), 1);
  EXPECT_EQ(roster.nAssigned(2, 0), 0);
  EXPECT_EQ(roster.nShiftsOnDay(0, 1), 1);
  EXPECT_TRUE(roster.isWorking(0, 0));
  EXPECT_FALSE(roster.isWorking(1, 0));
  EXPECT_EQ(roster.nShiftAssignments(0, 1), 1);
  EXPECT_EQ(roster.nShiftAssignments(1, 0), 0);
  EXPECT_TRUE(roster.isConsistent());
}

TEST(RosterTest, AssignmentsKeepTheInsertionOrder) {
  Roster roster(1, 5, 1);
  roster.assign(0, 3, 0);
  roster.assign(0, 1, 0);

  vector<Assignment> assignments = roster.staffAssignments(0);
  ASSERT_EQ(assignments.size(), 2u);
  EXPECT_EQ(assignments[0], Assignment(0, 3, 0));
  EXPECT_EQ(assignments[1], Assignment(0, 1, 0));

  // the last assignment is the last one inserted, not the latest day
  ASSERT_NE(roster.lastAssignment(0), nullptr);
  EXPECT_EQ(roster.lastAssignment(0)->day, 1);
  EXPECT_EQ(roster.assignments().back(), Assignment(0, 1, 0));
}

TEST(RosterTest, OutOfRangeQueriesAreEmpty) {
  Roster roster(1, 2, 1);
  roster.assign(0, 0, 0);
  EXPECT_EQ(roster.nAssigned(-1, 0), 0);
  EXPECT_EQ(roster.nAssigned(0, 3), 0);
  EXPECT_FALSE(roster.isWorking(0, -1));
  EXPECT_FALSE(roster.isWorking(0, 2));
}

TEST(RosterTest, AssignOutOfRangeThrows) {
  Roster roster(1, 2, 1);
  EXPECT_THROW(roster.assign(1, 0, 0), Tools::SRException);
  EXPECT_THROW(roster.assign(0, 2, 0), Tools::SRException);
  EXPECT_THROW(roster.assign(0, 0, -1), Tools::SRException);
  EXPECT_TRUE(roster.empty());
  EXPECT_TRUE(roster.isConsistent());
}

TEST(RosterTest, ToStringDisplaysTheGrid) {
  Roster roster(2, 3, 2);
  roster.assign(0, 0, 0);
  roster.assign(1, 2, 1);
  string str = roster.toString({"A", "B"}, {"D", "N"});
  EXPECT_NE(str.find("A |D  | - | - |"), string::npos);
  EXPECT_NE(str.find("B | - | - |N  |"), string::npos);
}

//-----------------------------------------------------------------------------
// Scenario
//-----------------------------------------------------------------------------

TEST(ScenarioTest, Lookups) {
  PScenario pScenario = test::makeScenario(
      7,
      {test::makeShift("D", 0), test::makeShift("N", 1, {0})},
      {test::makeStaff(0, "S1", 2, 5), test::makeStaff(1, "S2", 2, 5, {{1, 2}})},
      {CoverRequirement(0, 0, 0, 1, 10, 1)},
      {{}, {3, 4}});

  EXPECT_EQ(pScenario->nDays(), 7);
  EXPECT_EQ(pScenario->nShifts(), 2);
  EXPECT_EQ(pScenario->nStaff(), 2);
  EXPECT_EQ(pScenario->shiftId("N"), 1);
  EXPECT_EQ(pScenario->staffId("S2"), 1);
  EXPECT_THROW(pScenario->shiftId("L"), Tools::SRException);
  EXPECT_THROW(pScenario->staffId("S3"), Tools::SRException);

  EXPECT_TRUE(pScenario->isForbiddenSuccessor(1, 0));
  EXPECT_FALSE(pScenario->isForbiddenSuccessor(0, 1));
  EXPECT_TRUE(pScenario->isDayOff(1, 3));
  EXPECT_FALSE(pScenario->isDayOff(0, 3));
  EXPECT_FALSE(pScenario->staff(0).hasShiftLimit(1));
  EXPECT_EQ(pScenario->staff(1).maxShifts(1), 2);
  EXPECT_NE(pScenario->toString().find("S2"), string::npos);
}

TEST(ScenarioTest, DuplicateNamesThrow) {
  EXPECT_THROW(test::makeScenario(
      7, {test::makeShift("D", 0), test::makeShift("D", 1)},
      {test::makeStaff(0, "S1", 2, 5)}, {}), Tools::SRException);
  EXPECT_THROW(test::makeScenario(
      7, {test::makeShift("D", 0)},
      {test::makeStaff(0, "S1", 1, 5), test::makeStaff(1, "S1", 1, 5)}, {}),
      Tools::SRException);
}

TEST(ScenarioTest, IdsMustBeThePositions) {
  EXPECT_THROW(test::makeScenario(
      7, {test::makeShift("D", 1)}, {test::makeStaff(0, "S1", 1, 5)}, {}),
      Tools::SRException);
}

TEST(ShiftTest, ForbiddenSuccessors) {
  Shift night("N", 2, 600, {1, 0});
  EXPECT_TRUE(night.forbids(0));
  EXPECT_TRUE(night.forbids(1));
  EXPECT_FALSE(night.forbids(2));
  // the successors are sorted
  EXPECT_EQ(night.forbiddenSuccessors, (vector<int>{0, 1}));
}
