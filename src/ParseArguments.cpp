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

#include "ParseArguments.h"

#include <cstring>
#include <sstream>
#include <string>

#include "tools/InputPaths.h"
#include "tools/Tools.h"

using std::string;

namespace {

double readDouble(const char *arg, const string &str) {
  std::stringstream ss(str);
  double d;
  ss >> d;
  if (ss.fail() || ss.rdbuf()->in_avail() > 0)
    Tools::throwError("main: the value (%s) of the argument %s is not a number",
                      str.c_str(), arg);
  return d;
}

}  // namespace

/******************************************************************************
* Read the arguments
******************************************************************************/
std::unique_ptr<InputPaths> readArguments(int argc, char **argv) {
  std::unique_ptr<InputPaths> pInputPaths(new InputPaths());

  // Read the arguments and store them in inputPaths
  //
  int narg = 1;
  while (narg < argc) {
    const char *arg = argv[narg];
    if (narg + 1 >= argc)
      Tools::throwError("main: the argument %s has no value!", arg);

    // remove the quote marks that some launchers add around the values
    string str(argv[narg + 1]);
    std::size_t found = str.find('"');
    while (found != std::string::npos) {
      str.erase(found, 1);
      found = str.find('"');
    }

    if (!strcmp(arg, "--instance")) {
      pInputPaths->instance(str);
    } else if (!strcmp(arg, "--sol")) {
      pInputPaths->solutionPath(str);
    } else if (!strcmp(arg, "--log")) {
      pInputPaths->logPath(str);
    } else if (!strcmp(arg, "--param")) {
      pInputPaths->paramFile(str);
    } else if (!strcmp(arg, "--timeout")) {
      pInputPaths->timeOut(readDouble(arg, str));
    } else if (!strcmp(arg, "--verbose")) {
      pInputPaths->verbose(Tools::readInt(str));
    } else {
      Tools::throwError(
          "main: the argument (%s) does not match the expected list!", arg);
    }
    narg += 2;
  }

  // Throw an error if the instance file is missing
  if (pInputPaths->instance().empty())
    Tools::throwError("main: the instance file is missing (--instance)!");

  return pInputPaths;
}
