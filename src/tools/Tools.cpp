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

#include "tools/Tools.h"

#include <boost/algorithm/string.hpp>

#include <chrono>  // NOLINT
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Tools {

// Print the message and throw an exception
void throwError(const char *exceptionMsg) {
  fprintf(stderr, "Error caught: %s\n", exceptionMsg);
  throw SRException(exceptionMsg);
}

void throwError(const std::string &exceptionMsg) {
  throwError(exceptionMsg.c_str());
}

void openFile(const std::string &fileName, std::fstream *file) {
  // open the file
#ifdef SR_DEBUG
  std::cout << "Reading " << fileName << std::endl;
#endif
  file->open(fileName.c_str(), std::fstream::in);
  if (!file->is_open())
    Tools::throwError("The input file (%s) was not opened properly!",
                      fileName.c_str());
}

// Store the characters read until the separating character in pStrRead
//
char readUntilOneOfTwoChar(std::fstream *pFile,
                           char separator1,
                           char separator2,
                           std::string *pStrRead) {
  char cTmp = 'A';

  // empty the title string if it is not
  //
  if (!pStrRead->empty())
    pStrRead->erase();

  // go through the file until the delimiter is met
  //
  if (pFile->good()) {
    cTmp = pFile->get();
  }
  while (cTmp != separator1 && cTmp != separator2 && pFile->good()) {
    pStrRead->push_back(cTmp);
    cTmp = pFile->get();
  }

  return cTmp;
}

// Read a file stream until the separating character is met
//
bool readUntilChar(std::fstream *file, char separator, std::string *pTitle) {
  char cTmp = 'A';

  // empty the title string if it is not
  //
  if (!pTitle->empty())
    pTitle->erase();

  // go through the file until the delimiter is met
  //
  if (file->good()) {
    cTmp = file->get();
  }
  while (cTmp != separator && file->good()) {
    pTitle->push_back(cTmp);
    cTmp = file->get();
  }

  return file->good();
}

bool readLine(std::fstream *pFile, std::string *pStrRead) {
  pStrRead->clear();
  if (!std::getline(*pFile, *pStrRead))
    return false;
  // remove the end of line characters of the files written on windows
  trim(pStrRead);
  return true;
}

// Checks if the string (sentence) starts with the given substring (word)
//
bool strStartsWith(const std::string &sentence, const std::string &word) {
  return boost::algorithm::starts_with(sentence, word);
}

// Checks if the string (sentence) starts with the comment character
bool strStartsWithComment(const std::string &sentence) {
  if (sentence.empty()) return false;
  return sentence[0] == COMMENT_KEY;
}

// Checks if the string (sentence) ends with the given substring (word)
//
bool strEndsWith(const std::string &sentence, const std::string &word) {
  return boost::algorithm::ends_with(sentence, word);
}

std::vector<std::string> split(std::string sentence,
                               const std::string &delimiter) {
  std::vector<std::string> words;
  size_t pos = 0;
  while ((pos = sentence.find(delimiter)) != std::string::npos) {
    words.emplace_back(sentence.substr(0, pos));
    sentence.erase(0, pos + delimiter.length());
  }
  words.push_back(sentence);  // add last word
  return words;
}

// convert to UPPER CASES
std::string toUpperCase(std::string str) {
  boost::to_upper(str);
  return str;
}

void trim(std::string *s) {
  boost::trim(*s);
}

int readInt(const std::string &str) {
  std::string s = str;
  trim(&s);
  size_t pos = 0;
  int value = 0;
  try {
    value = std::stoi(s, &pos);
  } catch (const std::logic_error &) {
    Tools::throwError("\"%s\" is not an integer.", str.c_str());
  }
  if (pos != s.size())
    Tools::throwError("\"%s\" is not an integer.", str.c_str());
  return value;
}

/************************************************************************
* Read the options
*************************************************************************/
std::string loadOptions(
    const std::string &strOptionFile,
    std::function<bool(const std::string&, std::fstream *file)> load) {
  // open the file
  std::fstream file;
  openFile(strOptionFile, &file);

  // fill the attributes of the options structure
  std::string field, content;
  while (file.good()) {
    char sep = Tools::readUntilOneOfTwoChar(&file, '\n', '=', &field);
    trim(&field);
    // ignore line
    if (field.empty()) {
      continue;
    } else if (Tools::strStartsWithComment(field)) {
      // read line
      if (sep == '=')
        Tools::readUntilChar(&file, '\n', &field);
    } else if (sep != '=') {
      Tools::throwError(
          "Line without value (%s) when reading the options from file %s",
          field.c_str(), strOptionFile.c_str());
    } else {
      std::streampos valuePos = file.tellg();
      if (!load(field, &file))
        Tools::throwError(
            "Field not recognized (%s) when reading the options from file %s",
            field.c_str(), strOptionFile.c_str());
      if (file.fail())
        Tools::throwError(
            "Wrong value for the field %s when reading the options from file %s",
            field.c_str(), strOptionFile.c_str());
      // read again the whole value to keep track of the content
      file.seekg(valuePos);
      std::string value;
      Tools::readUntilChar(&file, '\n', &value);
      trim(&value);
      content += field + "=" + value + "\n";
    }
  }
  return content;
}

bool mkdirs(const std::string &dirPath) {
  // create directory if needed
  std::error_code ec;
  return std::filesystem::create_directories(dirPath, ec);
}

// constructor of Timer
//
Timer::Timer(std::string name, bool start) :
    name_(std::move(name)),
    cpuInit_(std::chrono::steady_clock::now()),
    cpuSinceStart_(0),
    isStarted_(false),
    isStopped_(true) {
  if (start) this->start();
}

// start the timer
//
void Timer::start() {
  if (isStarted_)
    throwError("Trying to start an already started timer (%s)!",
               name_.c_str());

  cpuInit_ = std::chrono::steady_clock::now();
  isStarted_ = true;
  isStopped_ = false;
}

// Stop the time and update the time spent since the last start
//
void Timer::stop() {
  if (isStopped_)
    throwError("Trying to stop an already stopped timer (%s)!",
               name_.c_str());

  cpuSinceStart_ = std::chrono::steady_clock::now() - cpuInit_;

  isStarted_ = false;
  isStopped_ = true;
}  // end stop

// Get the time spent since the last start of the timer without stopping it
//
double Timer::dSinceStart() {
  if (isStarted_)
    cpuSinceStart_ = std::chrono::steady_clock::now() - cpuInit_;
  return cpuSinceStart_.count();
}  // end dSinceStart

LogOutput::LogOutput(std::string logName, bool append) :
    pLogStream_(&std::cout), logName_(std::move(logName)),
    isStdOut_(true) {
  if (logName_.empty()) return;

  auto pos = logName_.rfind('/');
  if (pos != std::string::npos && pos > 0)
    mkdirs(logName_.substr(0, pos));
  auto *pFile = new std::ofstream(
      logName_.c_str(), append ? std::fstream::app : std::fstream::out);
  if (!pFile->is_open()) {
    delete pFile;
    Tools::throwError("The log file (%s) cannot be opened.", logName_.c_str());
  }
  pLogStream_ = pFile;
  isStdOut_ = false;
}

LogOutput::~LogOutput() {
  close();
  if (!isStdOut_) delete pLogStream_;
}

LogOutput &LogOutput::addCurrentTime() {
  auto now = std::chrono::system_clock::now();
  std::time_t current_time = std::chrono::system_clock::to_time_t(now);
  std::tm* time_info = std::localtime(&current_time);
  char buffer[128];
  strftime(buffer, sizeof(buffer), "%F %T", time_info);
  (*pLogStream_) << "[" << buffer << "]    ";
  return *this;
}

void LogOutput::close() {
  if (isStdOut_) {
    pLogStream_->flush();
    return;
  }
  auto *pStream = dynamic_cast<std::ofstream *>(pLogStream_);
  if (pStream && pStream->is_open()) pStream->close();
}

}  // namespace Tools
