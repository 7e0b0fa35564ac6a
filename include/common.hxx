#ifndef __PGDUMPCTL_COMMON__
#define __PGDUMPCTL_COMMON__

#include <cstdint>
#include <boost/date_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <iostream>
#include <fstream>
#include <stdexcept>

/* time handling supporting includes */
#include <ctime>
#include <ratio>
#include <chrono>

#include "pg_dumpctl.hxx"
#include <pgdumpctl_exception.hxx>

/*
 * Common objects starts here.
 */
namespace pgdumpctl {

  /*
   * Base class for all descendants in the
   * pg_dumpctl class hierarchy.
   */
  class CPGDumpCtlBase {

  public:
    static const int version_major_num = PG_DUMPCTL_MAJOR;
    static const int version_minor_num = PG_DUMPCTL_MINOR;

    CPGDumpCtlBase();
    virtual ~CPGDumpCtlBase();

    static std::string getVersionString();
    static int strToInt(std::string in);
    static std::string intToStr(int in);

    /**
     * Strict boolean conversion, accepts true/false, on/off,
     * yes/no and 1/0 (case insensitive). Throws CPGDumpCtlFailure
     * for anything else.
     */
    static bool strToBool(std::string in);

    static std::string makeLine(int width);
    static std::string makeLine(boost::format& formatted);
    static std::string makeHeader(std::string caption,
                                  boost::format& format,
                                  int width);

    /**
     * Format string with color escape sequence. If
     * STDOUT is *not* a terminal, those routines
     * are effectively a no-op.
     */
    static std::string stdout_red(std::string in, bool bold);
    static std::string stdout_green(std::string in, bool bold);


    /**
     * Formats the given UTC time as an ISO-8601 timestamp
     * suitable for file names, e.g. 2024-01-01T00-00-00.
     */
    static std::string filename_timestamp(boost::posix_time::ptime input);

    /**
     * Formats a seconds-since-epoch value as local
     * YYYY-MM-DD H24:MIN:SS.
     */
    static std::string time_to_str(std::time_t input);

    /**
     * Calculates a duration of high resolution time points in milliseconds.
     */
    static std::chrono::milliseconds calculate_duration_ms(std::chrono::steady_clock::time_point start,
                                                           std::chrono::steady_clock::time_point stop);

    /**
     * Returns a monotonic time point
     */
    static std::chrono::steady_clock::time_point current_hires_time_point();

    /**
     * Extracts the number of milliseconds from the given duration.
     */
    static uint64_t duration_get_ms(std::chrono::milliseconds ms);

    /**
     * Format given size value into kB, Mb or Gb
     */
    static std::string prettySize(uintmax_t size);

    /**
     * Resolves the given executable name in PATH. Names with a
     * directory component are checked as is. Returns an empty
     * path if nothing executable was found.
     */
    static boost::filesystem::path resolve_file_path(std::string filename);

    /**
     * Controls log level severity via boost::log interface
     */
    static void set_log_severity(std::string severity);
  };

}

#endif
