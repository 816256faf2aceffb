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

#include "data/Scenario.h"

#include <sstream>
#include <string>
#include <utility>

using std::string;
using std::vector;

//-----------------------------------------------------------------------------
//
//  C l a s s   S c e n a r i o
//
//  Class that contains all the attributes describing the scenario
//
//-----------------------------------------------------------------------------

Scenario::Scenario(string name,
                   int nDays,
                   vector<PShift> pShifts,
                   vector<PStaffMember> pStaff,
                   const vector2D<int> &daysOff,
                   vector<ShiftRequest> shiftOnRequests,
                   vector<ShiftRequest> shiftOffRequests,
                   vector<CoverRequirement> coverRequirements) :
    name_(std::move(name)),
    nDays_(nDays),
    pShifts_(std::move(pShifts)),
    pStaff_(std::move(pStaff)),
    shiftOnRequests_(std::move(shiftOnRequests)),
    shiftOffRequests_(std::move(shiftOffRequests)),
    coverRequirements_(std::move(coverRequirements)) {
  // build the maps of names: the ids must be the positions in the vectors
  for (size_t s = 0; s < pShifts_.size(); ++s) {
    const PShift &pS = pShifts_[s];
    if (pS->id != static_cast<int>(s))
      Tools::throwError("Shift %s has id %d instead of %d.",
                        pS->name.c_str(), pS->id, static_cast<int>(s));
    if (!shiftToInt_.emplace(pS->name, pS->id).second)
      Tools::throwError("Shift %s is defined twice.", pS->name.c_str());
  }
  for (size_t n = 0; n < pStaff_.size(); ++n) {
    const PStaffMember &pN = pStaff_[n];
    if (pN->num_ != static_cast<int>(n))
      Tools::throwError("Staff member %s has index %d instead of %d.",
                        pN->name_.c_str(), pN->num_, static_cast<int>(n));
    if (!staffToInt_.emplace(pN->name_, pN->num_).second)
      Tools::throwError("Staff member %s is defined twice.",
                        pN->name_.c_str());
  }

  // store the days off
  daysOff_.resize(pStaff_.size());
  Tools::initVector2D(&isDayOff_, nStaff(), nDays_, false);
  if (daysOff.size() > pStaff_.size())
    Tools::throwError("There are days off for %d staff members, but the "
                      "scenario has only %d staff members.",
                      static_cast<int>(daysOff.size()), nStaff());
  for (size_t n = 0; n < daysOff.size(); ++n)
    for (int day : daysOff[n]) {
      daysOff_[n].insert(day);
      if (day >= 0 && day < nDays_) isDayOff_[n][day] = true;
    }
}

int Scenario::shiftId(const string &name) const {
  auto it = shiftToInt_.find(name);
  if (it == shiftToInt_.end())
    Tools::throwError("Unknown shift %s in scenario %s.",
                      name.c_str(), name_.c_str());
  return it->second;
}

int Scenario::staffId(const string &name) const {
  auto it = staffToInt_.find(name);
  if (it == staffToInt_.end())
    Tools::throwError("Unknown staff member %s in scenario %s.",
                      name.c_str(), name_.c_str());
  return it->second;
}

string Scenario::toString() const {
  std::stringstream rep;
  rep << "############################################################"
      << std::endl;
  rep << "##############    Scenario : " << name_ << "    ##############"
      << std::endl;
  rep << "############################################################"
      << std::endl;
  rep << "Horizon                   : " << nDays_ << " days" << std::endl;
  rep << "Number of shifts          : " << nShifts() << std::endl;
  rep << "Number of staff members   : " << nStaff() << std::endl;
  rep << "Number of shift on requests  : " << shiftOnRequests_.size()
      << std::endl;
  rep << "Number of shift off requests : " << shiftOffRequests_.size()
      << std::endl;
  rep << "Number of cover requirements : " << coverRequirements_.size()
      << std::endl;
  rep << "# SHIFTS" << std::endl;
  for (const PShift &pS : pShifts_)
    rep << pS->toString() << std::endl;
  rep << "# STAFF" << std::endl;
  for (const PStaffMember &pN : pStaff_)
    rep << pN->toString();
  return rep.str();
}
