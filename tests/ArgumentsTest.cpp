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

#include <memory>
#include <string>
#include <vector>

#include "ParseArguments.h"
#include "tools/Tools.h"

using std::string;
using std::vector;

namespace {

// build argv from the arguments (the name of the program is added)
std::unique_ptr<InputPaths> parse(vector<string> args) {
  args.insert(args.begin(), "staffroster");
  vector<char *> argv;
  for (string &arg : args) argv.push_back(&arg[0]);
  return readArguments(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(ArgumentsTest, AllArguments) {
  std::unique_ptr<InputPaths> pInputPaths = parse(
      {"--instance", "data/Instance1.txt", "--sol", "out", "--log", "log.txt",
       "--param", "greedy.txt", "--timeout", "2.5", "--verbose", "2"});
  EXPECT_EQ(pInputPaths->instance(), "data/Instance1.txt");
  EXPECT_EQ(pInputPaths->solutionPath(), "out");
  EXPECT_EQ(pInputPaths->logPath(), "log.txt");
  EXPECT_EQ(pInputPaths->paramFile(), "greedy.txt");
  EXPECT_DOUBLE_EQ(pInputPaths->timeOut(), 2.5);
  EXPECT_EQ(pInputPaths->verbose(), 2);
}

TEST(ArgumentsTest, DefaultValues) {
  std::unique_ptr<InputPaths> pInputPaths =
      parse({"--instance", "Instance1.txt"});
  EXPECT_TRUE(pInputPaths->solutionPath().empty());
  EXPECT_TRUE(pInputPaths->paramFile().empty());
  EXPECT_LT(pInputPaths->timeOut(), 0);
  EXPECT_EQ(pInputPaths->verbose(), -1);
}

TEST(ArgumentsTest, QuoteMarksAreRemoved) {
  std::unique_ptr<InputPaths> pInputPaths =
      parse({"--instance", "\"Instance1.txt\""});
  EXPECT_EQ(pInputPaths->instance(), "Instance1.txt");
}

TEST(ArgumentsTest, MissingInstanceThrows) {
  EXPECT_THROW(parse({"--sol", "out"}), Tools::SRException);
  EXPECT_THROW(parse({}), Tools::SRException);
}

TEST(ArgumentsTest, UnknownArgumentThrows) {
  EXPECT_THROW(parse({"--instance", "Instance1.txt", "--rand", "3"}),
               Tools::SRException);
}

TEST(ArgumentsTest, MissingValueThrows) {
  EXPECT_THROW(parse({"--instance"}), Tools::SRException);
  EXPECT_THROW(parse({"--instance", "Instance1.txt", "--verbose"}),
               Tools::SRException);
}

TEST(ArgumentsTest, MalformedNumberThrows) {
  EXPECT_THROW(parse({"--instance", "Instance1.txt", "--timeout", "ten"}),
               Tools::SRException);
  EXPECT_THROW(parse({"--instance", "Instance1.txt", "--verbose", "1.5"}),
               Tools::SRException);
}
