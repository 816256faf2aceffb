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

#ifndef SRC_TOOLS_TOOLS_H_
#define SRC_TOOLS_TOOLS_H_

#include <chrono>  // NOLINT (suppress cpplint error)
#include <cstdio>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

static const char COMMENT_KEY = '#';
static const char SECTION_KEY[] = "SECTION_";
static const char REST_DISPLAY[] = " - ";  // should be of the size of pad
static const int SHIFT_PAD = 3;

// definitions of multi-dimensional vector types
//
template<class T> using vector2D = std::vector<std::vector<T>>;
template<class T> using vector3D = std::vector<vector2D<T>>;

namespace Tools {

// Exception thrown by every error of the roster library
//
struct SRException : std::exception {
  explicit SRException(const char *what) : std::exception(), what_(what) {}
  explicit SRException(std::string what) :
      std::exception(), what_(std::move(what)) {}
  template<typename ...Args>
  SRException(const char *str, Args... args) {
    char buff[999];
    snprintf(buff, sizeof(buff), str, args...);
    what_ = buff;
  }

  const char *what() const throw() override {
    return what_.c_str();
  }

 private:
  std::string what_;
};

template<typename ...Args>
std::string string(const char *str, Args... args) {
  char buff[999];
  snprintf(buff, sizeof(buff), str, args...);
  return buff;
}

// Print the message on the error stream and throw an SRException
//
void throwError(const char *exceptionMsg);
void throwError(const std::string &exceptionMsg);

template<typename ...Args>
void throwError(const char *str, Args... args) {
  char buff[999];
  snprintf(buff, sizeof(buff), str, args...);
  throwError(buff);
}

// Open the file in read mode, throw if it cannot be opened
void openFile(const std::string &fileName, std::fstream *file);

// Read a file stream until the separating character (or one of them) is met
// Store the characters read until the separating character in pStrRead
char readUntilOneOfTwoChar(std::fstream *pFile,
                           char separator1,
                           char separator2,
                           std::string *pStrRead);

// Read a file stream until the separating character is met
bool readUntilChar(std::fstream *file, char separator, std::string *pTitle);

// read until end of line and trim the result
bool readLine(std::fstream *pFile, std::string *pStrRead);

// Checks if the string (sentence) starts with the given substring (word)
bool strStartsWith(const std::string &sentence, const std::string &word);

// Checks if the string (sentence) starts with the comment character
bool strStartsWithComment(const std::string &sentence);

// Checks if the string (sentence) ends with the given substring (word)
//
bool strEndsWith(const std::string &sentence, const std::string &word);

// split string: empty words are kept
std::vector<std::string> split(std::string sentence,
                               const std::string &delimiter);

// convert to UPPER CASES
std::string toUpperCase(std::string str);

// trim from both ends (in place)
void trim(std::string *s);

// Read an integer and throw if the whole string is not an integer
int readInt(const std::string &str);

// Read the options file: for each line field=value, the function load is
// called with the field and the stream positioned on the value.
// The function must return false if the field is unknown.
// The content of the file is returned to be logged.
std::string loadOptions(
    const std::string &strOptionFile,
    std::function<bool(const std::string &, std::fstream *file)> load);

// initializes a 1D or 2D Vector of the given size (filled only with val)
//
template<class T>
void initVector(std::vector<T> *v, int m, T val) {
  v->clear();
  v->resize(m, val);
}

template<class T>
void initVector2D(vector2D<T> *v2D, int m, int n, T val) {
  v2D->clear();
  v2D->resize(m);
  for (std::vector<T> &v : *v2D) initVector(&v, n, val);
}

// Days of the week: the horizon always starts on a Monday
inline bool isSaturday(int dayId) { return (dayId % 7) == 5; }
inline bool isSunday(int dayId) { return (dayId % 7) == 6; }
inline int weekOf(int dayId) { return dayId / 7; }

// return the name for the enum from a given map of name
template<typename T>
static const std::string &getNameForEnum(
    const std::map<std::string, T> &typesByName, T type) {
  for (const auto &p : typesByName)
    if (p.second == type) return p.first;
  Tools::throwError("No name found in the map for the given type");
  return typesByName.begin()->first;
}

// read an enum in the given map of names (the name is converted to upper case)
template<typename T>
static T readEnum(const std::map<std::string, T> &typesByName,
                  const std::string &name) {
  auto it = typesByName.find(toUpperCase(name));
  if (it == typesByName.end())
    Tools::throwError("Unknown value: %s", name.c_str());
  return it->second;
}

// High resolution timer class to profile the performance of the algorithms
//
class Timer {
 public:
  // constructor and destructor
  //
  explicit Timer(std::string name = "", bool start = false);

  ~Timer() {}

 private:
  std::string name_;

  std::chrono::time_point<std::chrono::steady_clock> cpuInit_;
  std::chrono::duration<double> cpuSinceStart_;

  bool isStarted_;
  bool isStopped_;

 public:
  void start();

  void stop();

  bool isStarted() const { return isStarted_; }

  // get the time spent since the last time the timer was started
  //
  double dSinceStart();
};

bool mkdirs(const std::string &directoryPath);

// Instantiate an object of this class to write directly in the attribute log
// file.
// If the name of the log is empty, the outputs are written in std::cout.
//
class LogOutput {
 private:
  std::ostream *pLogStream_;
  std::string logName_;
  bool isStdOut_;

 public:
  explicit LogOutput(std::string logName = "", bool append = true);

  LogOutput(const LogOutput &) = delete;
  LogOutput &operator=(const LogOutput &) = delete;

  ~LogOutput();

  void close();

  // redefine the output function
  //
  template<typename T>
  LogOutput &operator<<(const T &output) {
    (*pLogStream_) << std::left << std::setprecision(5) << output;
    return *this;
  }

  LogOutput &operator<<(std::ostream &(*func)(std::ostream &)) {
    func(*pLogStream_);
    return *this;
  }

  template<typename T>
  void printnl(const T &output) {
    (*pLogStream_) << output << std::endl;
  }

  template<typename T, typename ...Args>
  void printnl(const char *str, const T &arg0, Args... args) {
    char buff[999];
    snprintf(buff, sizeof(buff), str, arg0, args...);
    printnl(buff);
  }

  LogOutput &addCurrentTime();
};

}  // namespace Tools

#endif  // SRC_TOOLS_TOOLS_H_
