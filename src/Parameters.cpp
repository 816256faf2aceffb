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

#include "Parameters.h"

#include <sstream>
#include <string>

using std::string;

//-----------------------------------------------------------------------------
//  C l a s s   G r e e d y O p t i o n s
//-----------------------------------------------------------------------------

// read a name in the stream and return the corresponding enum
template<typename T>
static T readEnumValue(const std::map<std::string, T> &typesByName,
                       std::fstream *file) {
  string name;
  *file >> name;
  return Tools::readEnum(typesByName, name);
}

bool GreedyOptions::setParameter(const string &field, std::fstream *file) {
  try {
    if (Tools::strEndsWith(field, "requirementOrder")) {
      requirementOrder_ = readEnumValue(requirementOrdersByName, file);
    } else if (Tools::strEndsWith(field, "staffOrder")) {
      staffOrder_ = readEnumValue(staffOrdersByName, file);
    } else if (Tools::strEndsWith(field, "successionLookup")) {
      successionLookup_ = readEnumValue(successionLookupsByName, file);
    } else if (Tools::strEndsWith(field, "consecutiveRunScan")) {
      consecutiveRunScan_ = readEnumValue(consecutiveRunScansByName, file);
    } else if (Tools::strEndsWith(field, "stopAtFirstUnmet")) {
      *file >> stopAtFirstUnmet_;
    } else if (Tools::strEndsWith(field, "maxSolvingTimeSeconds")) {
      *file >> maxSolvingTimeSeconds_;
    } else if (Tools::strEndsWith(field, "verbose")) {
      *file >> verbose_;
    } else if (Tools::strEndsWith(field, "logfile")) {
      string line;
      std::getline(*file, line);
      // an empty value at the end of the file is not an error
      if (line.empty()) file->clear();
      Tools::trim(&line);
      logfile_ = line;
    } else {
      return false;
    }
    return true;
  } catch (const std::exception &) {
    std::cerr << "Exception thrown while processing field " << field
              << std::endl;
    throw;
  }
}

void GreedyOptions::read(const string &strFile) {
  string content = Tools::loadOptions(
      strFile, [this](const std::string &field, std::fstream *file) {
        return setParameter(field, file);
      });

  Tools::LogOutput log(logfile_, true);
  log << "===================================================" << std::endl;
  log.addCurrentTime() << "Greedy options : " << strFile << std::endl;
  log << content;
  log << "===================================================" << std::endl;
}

string GreedyOptions::toString() const {
  std::stringstream rep;
  rep << "requirementOrder=" << Tools::getNameForEnum(
      requirementOrdersByName, requirementOrder_) << std::endl;
  rep << "staffOrder=" << Tools::getNameForEnum(
      staffOrdersByName, staffOrder_) << std::endl;
  rep << "successionLookup=" << Tools::getNameForEnum(
      successionLookupsByName, successionLookup_) << std::endl;
  rep << "consecutiveRunScan=" << Tools::getNameForEnum(
      consecutiveRunScansByName, consecutiveRunScan_) << std::endl;
  rep << "stopAtFirstUnmet=" << stopAtFirstUnmet_ << std::endl;
  rep << "maxSolvingTimeSeconds=" << maxSolvingTimeSeconds_ << std::endl;
  rep << "verbose=" << verbose_ << std::endl;
  rep << "logfile=" << logfile_ << std::endl;
  return rep.str();
}
