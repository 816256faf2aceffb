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

#include "parsing/ParseNRP.h"

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

using std::string;
using std::vector;
using std::map;

namespace {

// line of a section with its number in the file
struct NRPLine {
  int lineNum;
  string content;
};

const vector<string> NRP_SECTIONS = {
    "HORIZON", "SHIFTS", "STAFF", "DAYS_OFF", "SHIFT_ON_REQUESTS",
    "SHIFT_OFF_REQUESTS", "COVER"
};

// Split a data line and check the number of fields
vector<string> readFields(const string &fileName, const NRPLine &line,
                          size_t minFields, size_t maxFields) {
  vector<string> tokens = Tools::split(line.content, ",");
  for (string &t : tokens) Tools::trim(&t);
  if (tokens.size() < minFields || tokens.size() > maxFields)
    Tools::throwError("%s:%d: expected between %d and %d fields, read %d (%s)",
                      fileName.c_str(), line.lineNum,
                      static_cast<int>(minFields), static_cast<int>(maxFields),
                      static_cast<int>(tokens.size()), line.content.c_str());
  return tokens;
}

int readDay(const string &fileName, const NRPLine &line, const string &str,
            int nDays) {
  int day = Tools::readInt(str);
  if (day < 0 || day >= nDays)
    Tools::throwError("%s:%d: day %d is out of the horizon [0, %d)",
                      fileName.c_str(), line.lineNum, day, nDays);
  return day;
}

int readNonNegative(const string &fileName, const NRPLine &line,
                    const string &str) {
  int value = Tools::readInt(str);
  if (value < 0)
    Tools::throwError("%s:%d: the value %d must be non-negative",
                      fileName.c_str(), line.lineNum, value);
  return value;
}

int findId(const string &fileName, const NRPLine &line,
           const map<string, int> &idsByName, const string &name,
           const char *type) {
  auto it = idsByName.find(name);
  if (it == idsByName.end())
    Tools::throwError("%s:%d: unknown %s %s",
                      fileName.c_str(), line.lineNum, type, name.c_str());
  return it->second;
}

}  // namespace

//--------------------------------------------------------------------------
// Method that read an NRP input files and stores the content in the
// output scenario instance
//
PScenario readNRPInstance(const string &fileName) {
  std::fstream file;
  Tools::openFile(fileName, &file);

  // fetch instance name
  string instName = Tools::split(fileName, "/").back();
  instName = Tools::split(instName, ".").front();

  // Read all the sections: comments and empty lines are skipped
  map<string, vector<NRPLine>> sections;
  string strTmp, currentSection;
  int lineNum = 0;
  while (Tools::readLine(&file, &strTmp)) {
    lineNum++;
    if (strTmp.empty() || Tools::strStartsWithComment(strTmp)) continue;
    if (Tools::strStartsWith(strTmp, SECTION_KEY)) {
      currentSection = strTmp.substr(string(SECTION_KEY).size());
      if (std::find(NRP_SECTIONS.begin(), NRP_SECTIONS.end(), currentSection)
          == NRP_SECTIONS.end())
        Tools::throwError("%s:%d: unknown section %s",
                          fileName.c_str(), lineNum, strTmp.c_str());
      if (sections.count(currentSection))
        Tools::throwError("%s:%d: section %s is defined twice",
                          fileName.c_str(), lineNum, strTmp.c_str());
      sections[currentSection];
    } else if (currentSection.empty()) {
      Tools::throwError("%s:%d: data found before the first section",
                        fileName.c_str(), lineNum);
    } else {
      sections[currentSection].push_back({lineNum, strTmp});
    }
  }
  for (const char *mandatory : {"HORIZON", "SHIFTS", "STAFF"})
    if (!sections.count(mandatory))
      Tools::throwError("The NRP file %s has no section SECTION_%s",
                        fileName.c_str(), mandatory);

  // Read the horizon
  const vector<NRPLine> &horizon = sections["HORIZON"];
  if (horizon.size() != 1)
    Tools::throwError("%s: SECTION_HORIZON must contain exactly one line",
                      fileName.c_str());
  int nDays = Tools::readInt(horizon.front().content);
  if (nDays <= 0)
    Tools::throwError("%s:%d: the horizon must be positive",
                      fileName.c_str(), horizon.front().lineNum);

  // Read shifts
  // ShiftID, Length in min, Shifts which cannot follow this shift | separated
  map<string, int> shiftToInt;
  vector<string> intToShift;
  vector<int> shiftDurations;
  vector2D<string> forbiddenShiftSuccessorsID;
  const vector<NRPLine> &shiftLines = sections["SHIFTS"];
  for (const NRPLine &line : shiftLines) {
    vector<string> tokens = readFields(fileName, line, 2, 3);
    if (!shiftToInt.emplace(tokens[0], intToShift.size()).second)
      Tools::throwError("%s:%d: shift %s is defined twice",
                        fileName.c_str(), line.lineNum, tokens[0].c_str());
    intToShift.push_back(tokens[0]);
    shiftDurations.push_back(readNonNegative(fileName, line, tokens[1]));
    forbiddenShiftSuccessorsID.push_back(
        tokens.size() > 2 ? Tools::split(tokens[2], "|") : vector<string>());
  }
  int nShifts = static_cast<int>(intToShift.size());

  // create the shifts once all the names are known
  vector<PShift> pShifts;
  for (int i = 0; i < nShifts; i++) {
    vector<int> forbiddenSuccessors;
    for (string s : forbiddenShiftSuccessorsID[i]) {
      Tools::trim(&s);
      if (s.empty()) continue;
      forbiddenSuccessors.push_back(
          findId(fileName, shiftLines[i], shiftToInt, s, "shift"));
    }
    pShifts.push_back(std::make_shared<Shift>(
        intToShift[i], i, shiftDurations[i], forbiddenSuccessors));
  }

  // Read staff
  // ID, MaxShifts (ShiftID=cap | separated), [MaxTotalShifts,]
  // MaxTotalMinutes, MinTotalMinutes, MaxConsecutiveShifts,
  // MinConsecutiveShifts, MinConsecutiveDaysOff, [MaxWeekends]
  map<string, int> staffToInt;
  vector<PStaffMember> pStaff;
  for (const NRPLine &line : sections["STAFF"]) {
    vector<string> tokens = readFields(fileName, line, 7, 9);
    int nStaff = static_cast<int>(pStaff.size());
    if (!staffToInt.emplace(tokens[0], nStaff).second)
      Tools::throwError("%s:%d: staff member %s is defined twice",
                        fileName.c_str(), line.lineNum, tokens[0].c_str());

    // MaxShifts: entries without a cap are ignored
    vector<int> maxShifts(nShifts, NO_LIMIT);
    for (string s : Tools::split(tokens[1], "|")) {
      Tools::trim(&s);
      if (s.find('=') == string::npos) continue;
      vector<string> p = Tools::split(s, "=");
      if (p.size() != 2)
        Tools::throwError("%s:%d: wrong shift limit %s",
                          fileName.c_str(), line.lineNum, s.c_str());
      Tools::trim(&p[0]);
      Tools::trim(&p[1]);
      int shift = findId(fileName, line, shiftToInt, p[0], "shift");
      maxShifts[shift] = readNonNegative(fileName, line, p[1]);
    }

    // the extended layout has a maximum total number of shifts in 3rd position
    size_t f = 2;
    int maxTotalShifts = NO_LIMIT;
    if (tokens.size() == 9)
      maxTotalShifts = readNonNegative(fileName, line, tokens[f++]);
    int maxTot = readNonNegative(fileName, line, tokens[f++]),
        minTot = readNonNegative(fileName, line, tokens[f++]),
        maxCons = readNonNegative(fileName, line, tokens[f++]),
        minCons = readNonNegative(fileName, line, tokens[f++]),
        minConsDaysOff = readNonNegative(fileName, line, tokens[f++]);
    int maxWE = NO_LIMIT;
    if (f < tokens.size())
      maxWE = readNonNegative(fileName, line, tokens[f]);

    pStaff.push_back(std::make_shared<StaffMember>(
        nStaff, tokens[0], maxShifts, maxTotalShifts, minTot, maxTot,
        minCons, maxCons, minConsDaysOff, maxWE));
  }

  // Read hard days off
  // EmployeeID, Day, Day, ...
  vector2D<int> daysOff(pStaff.size());
  for (const NRPLine &line : sections["DAYS_OFF"]) {
    vector<string> tokens = readFields(fileName, line, 1, nDays + 1);
    int staffId = findId(fileName, line, staffToInt, tokens[0], "staff member");
    for (size_t i = 1; i < tokens.size(); i++) {
      if (tokens[i].empty()) continue;
      daysOff[staffId].push_back(readDay(fileName, line, tokens[i], nDays));
    }
  }

  // Read soft shift on and shift off requests
  // EmployeeID, Day, ShiftID, Weight
  auto readRequests = [&](const string &section) {
    vector<ShiftRequest> requests;
    for (const NRPLine &line : sections[section]) {
      vector<string> tokens = readFields(fileName, line, 4, 4);
      requests.emplace_back(
          findId(fileName, line, staffToInt, tokens[0], "staff member"),
          readDay(fileName, line, tokens[1], nDays),
          findId(fileName, line, shiftToInt, tokens[2], "shift"),
          readNonNegative(fileName, line, tokens[3]));
    }
    return requests;
  };
  vector<ShiftRequest> shiftOnRequests = readRequests("SHIFT_ON_REQUESTS"),
      shiftOffRequests = readRequests("SHIFT_OFF_REQUESTS");

  // Read the demand
  // Day, ShiftID, Requirement, Weight for under, Weight for over
  vector<CoverRequirement> coverRequirements;
  for (const NRPLine &line : sections["COVER"]) {
    vector<string> tokens = readFields(fileName, line, 5, 5);
    int num = static_cast<int>(coverRequirements.size());
    coverRequirements.emplace_back(
        num,
        readDay(fileName, line, tokens[0], nDays),
        findId(fileName, line, shiftToInt, tokens[1], "shift"),
        readNonNegative(fileName, line, tokens[2]),
        readNonNegative(fileName, line, tokens[3]),
        readNonNegative(fileName, line, tokens[4]));
  }

  return std::make_shared<const Scenario>(instName,
                                          nDays,
                                          pShifts,
                                          pStaff,
                                          daysOff,
                                          shiftOnRequests,
                                          shiftOffRequests,
                                          coverRequirements);
}
