#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "common.hxx"

using namespace pgdumpctl;
using namespace std;
using namespace boost::posix_time;
using namespace std::chrono;

CPGDumpCtlBase::CPGDumpCtlBase() {
  /* currently empty */
}

CPGDumpCtlBase::~CPGDumpCtlBase() {
  /* nothing special */
}

string CPGDumpCtlBase::getVersionString() {
  return string("pg_dumpctl, version "
                + intToStr(PG_DUMPCTL_MAJOR)
                + "."
                + intToStr(PG_DUMPCTL_MINOR));
}

boost::filesystem::path CPGDumpCtlBase::resolve_file_path(std::string filename) {

  namespace bfs = boost::filesystem;

  std::vector<std::string> path_list;
  boost::system::error_code ec;

  if (filename.empty())
    return bfs::path();

  /*
   * Explicit paths (absolute or relative to the working
   * directory) are not looked up in PATH.
   */
  if (filename.find('/') != std::string::npos) {

    bfs::path explicit_path(filename);

    if (bfs::is_regular_file(explicit_path, ec)
        && ::access(explicit_path.string().c_str(), X_OK) == 0)
      return explicit_path;

    return bfs::path();

  }

  char *pathnames = getenv("PATH");

  if (pathnames == NULL)
    return bfs::path();

  boost::split(path_list, pathnames, boost::is_any_of(":"));

  for(auto &path_name : path_list) {

    /* An empty PATH element means the current directory */
    bfs::path lookup_file_path = bfs::path(path_name.empty() ? "." : path_name) / bfs::path(filename);

    if (bfs::is_regular_file(lookup_file_path, ec)
        && ::access(lookup_file_path.string().c_str(), X_OK) == 0)
      return lookup_file_path;

  }

  return bfs::path();
}

void CPGDumpCtlBase::set_log_severity(std::string severity) {

  namespace logging = boost::log;

  logging::trivial::severity_level level;

  if (severity == "trace")
    level = logging::trivial::trace;
  else if (severity == "debug")
    level = logging::trivial::debug;
  else if (severity == "info")
    level = logging::trivial::info;
  else if (severity == "warning")
    level = logging::trivial::warning;
  else if (severity == "error")
    level = logging::trivial::error;
  else if (severity == "fatal")
    level = logging::trivial::fatal;
  else
    throw CPGDumpCtlFailure("unknown log severity \"" + severity + "\"");

  logging::core::get()->set_filter(logging::trivial::severity >= level);

}

std::string CPGDumpCtlBase::filename_timestamp(ptime input) {

  boost::gregorian::date d = input.date();
  time_duration td = input.time_of_day();

  return (boost::format("%04d-%02d-%02dT%02d-%02d-%02d")
          % static_cast<int>(d.year())
          % static_cast<int>(d.month())
          % static_cast<int>(d.day())
          % td.hours()
          % td.minutes()
          % td.seconds()).str();

}

std::string CPGDumpCtlBase::time_to_str(std::time_t input) {

  struct tm tm_local;
  char res[64];

  memset(res, 0, sizeof(res));
  localtime_r(&input, &tm_local);

  if (std::strftime(res, sizeof(res), "%Y-%m-%d %H:%M:%S", &tm_local))
    return string(res);

  return "";

}

steady_clock::time_point CPGDumpCtlBase::current_hires_time_point() {

  return steady_clock::now();

}

std::chrono::milliseconds CPGDumpCtlBase::calculate_duration_ms(steady_clock::time_point start,
                                                                steady_clock::time_point stop) {

  auto result = duration_cast<std::chrono::milliseconds>(stop - start);
  return result;

}

uint64_t CPGDumpCtlBase::duration_get_ms(std::chrono::milliseconds ms) {
  return ms.count();
}

int CPGDumpCtlBase::strToInt(std::string in) {

  std::istringstream iss(in);
  int result;

  iss >> result;

  if (iss.fail() || !iss.eof()) {
    throw CPGDumpCtlFailure("invalid integer value \"" + in + "\"");
  }

  return result;
}

bool CPGDumpCtlBase::strToBool(std::string in) {

  std::string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(in));

  if (value == "true" || value == "on" || value == "yes" || value == "1")
    return true;

  if (value == "false" || value == "off" || value == "no" || value == "0")
    return false;

  throw CPGDumpCtlFailure("invalid boolean value \"" + in + "\"");

}

string CPGDumpCtlBase::intToStr(int in) {
  stringstream ss;

  ss << in;
  return ss.str();
}

std::string CPGDumpCtlBase::makeLine(int width) {

  ostringstream line;

  for (int i = 0; i < width; i++) {
    line << '-';
  }

  return line.str();

}

std::string CPGDumpCtlBase::makeLine(boost::format& formatted) {

  std::ostringstream line;

  line << formatted << endl;
  return line.str();

}

std::string CPGDumpCtlBase::makeHeader(std::string caption,
                                       boost::format& format,
                                       int width) {

  std::ostringstream header;

  header << caption << endl;
  header << CPGDumpCtlBase::makeLine(width) << endl;
  header << format << endl;
  header << CPGDumpCtlBase::makeLine(width) << endl;

  return header.str();
}

std::string CPGDumpCtlBase::stdout_red(std::string in, bool bold) {

  /* In case not a terminal, return plain string */
  if (!isatty(fileno(stdout)))
    return in;

  if (bold)
    return string("\033[1;31m" + in + " \033[0m");
  else
    return string("\033[0;31m" + in + " \033[0m");

}

std::string CPGDumpCtlBase::stdout_green(std::string in, bool bold) {

    /* In case not a terminal, return plain string */
  if (!isatty(fileno(stdout)))
    return in;

  if (bold)
    return string("\033[1;32m" + in + " \033[0m");
  else
    return string("\033[0;32m" + in + " \033[0m");

}

/*
 * This code is borrowed from PostgreSQL's pg_size_pretty()
 * function, see src/backend/utils/adt/dbsize.c
 */
std::string CPGDumpCtlBase::prettySize(uintmax_t size) {

  std::ostringstream result;
  /*
   * bytes are converted into kB starting above 10240 bytes.
   */
  uintmax_t limit_plain = 10 * 1024;
  uintmax_t limit = (2 * limit_plain) - 1;

  if (size < limit_plain) {
    result << size << " bytes";
    return result.str();
  }

  size >>= 10;

  if (size < limit) {
    result << size << " kB";
    return result.str();
  }

  size >>= 10;

  if (size < limit) {
    result << size << " MB";
    return result.str();
  }

  size >>= 10;

  if (size < limit) {
    result << size << " GB";
    return result.str();
  }

  result << size << " TB";
  return result.str();

}
