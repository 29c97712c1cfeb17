/**  
 * Copyright (c) 2009 Carnegie Mellon University. 
 *     All rights reserved.
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing,
 *  software distributed under the License is distributed on an "AS
 *  IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either
 *  express or implied.  See the License for the specific language
 *  governing permissions and limitations under the License.
 *
 * For more about this software visit:
 *
 *      http://www.graphlab.ml.cmu.edu
 *
 */


/**
 * @file logger.hpp
 * Usage:
 * First include logger.hpp. To log, use the logger() macro or the
 * logstream() macro.
 *
 * There are 2 output levels. A "soft" output level which is set by
 * calling global_logger().set_log_level(), as well as a "hard" output
 * level OUTPUTLEVEL which is set in the source code (logger.hpp).
 *
 * When you call "logger()" with a loglevel and if the loglevel is greater
 * than both of the output levels, the string will be written to the log
 * file and/or the console. Otherwise, logger() has no effect.
 *
 * \code
 *   logstream(LOG_INFO) << "Superstep " << iteration << " done" << std::endl;
 *   logger(LOG_WARNING, "%d vertices did not halt", count);
 * \endcode
 *
 * A line logged at LOG_FATAL writes a backtrace and throws a
 * std::runtime_error carrying the message once std::endl is reached.
 */

#ifndef BSPLAB_LOG_LOG_HPP
#define BSPLAB_LOG_LOG_HPP
#include <fstream>
#include <sstream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <cstdarg>
#include <stdexcept>
#include <pthread.h>

/**
 * \def LOG_FATAL
 *   Used for fatal and probably irrecoverable conditions
 * \def LOG_ERROR
 *   Used for errors which are recoverable within the scope of the function
 * \def LOG_WARNING
 *   Logs interesting conditions which are probably not fatal
 * \def LOG_EMPH
 *   Outputs as LOG_INFO, but in LOG_WARNING colors. Useful for
 *   outputting information you want to emphasize.
 * \def LOG_INFO
 *   Used for providing general useful information
 * \def LOG_DEBUG
 *   Debugging purposes only
 */
#define LOG_NONE 6
#define LOG_FATAL 5
#define LOG_ERROR 4
#define LOG_WARNING 3
#define LOG_EMPH 2
#define LOG_INFO 1
#define LOG_DEBUG 0

/**
 * \def OUTPUTLEVEL
 *  The minimum level to log at
 * \def LOG_NONE
 *  OUTPUTLEVEL to LOG_NONE to disable logging
 */
#ifndef OUTPUTLEVEL
#define OUTPUTLEVEL LOG_DEBUG
#endif
/// If set, logs to screen will be printed in color
#define COLOROUTPUT


/**
 * \def logger(lvl,fmt,...)
 *    extracts the filename, line number and function name and calls
 *    _log. It will be optimized away if LOG_NONE is set.
 */
#if OUTPUTLEVEL == LOG_NONE
// totally disable logging
#define logger(lvl,fmt,...)
#define logstream(lvl) if(0) null_stream()
#else

#define logger(lvl,fmt,...)                 \
    (log_dispatch<(lvl >= OUTPUTLEVEL)>::exec(lvl,__FILE__, __func__ ,__LINE__,fmt,##__VA_ARGS__))

#define logstream(lvl)                      \
    (log_stream_dispatch<(lvl >= OUTPUTLEVEL)>::exec(lvl,__FILE__, __func__ ,__LINE__) )
#endif

namespace logger_impl {
struct streambuff_tls_entry {
  std::stringstream streambuffer;
  bool streamactive;
  int streamloglevel;
  streambuff_tls_entry() : streamactive(false), streamloglevel(LOG_NONE) { }
};
}


/** Defined in backtrace.cpp */
void __print_back_trace();

/** Parses a level name ("debug", "info", "emph", "warning", "error",
    "fatal", "none"), case-insensitive. Returns -1 when the name is
    unknown. */
int parse_log_level(const std::string& name);

/**
  logging class.
  This writes to a file, and/or the system console.
*/
class file_logger{
 public:
  /** Default constructor. By default, log_to_console is on,
      there is no log file, and the log level is set to LOG_INFO
  */
  file_logger();

  ~file_logger();   /// destructor. flushes and closes the current log file

  /** Closes the current log file if one exists.
      if 'file' is not an empty string, it will be opened and
      all subsequent log output will be written into 'file'.
      Any existing content of 'file' will be cleared.
      Return true on success and false on failure.
  */
  bool set_log_file(std::string file);

  /// If consolelog is true, subsequent log output will be written to stderr
  void set_log_to_console(bool consolelog) {
    log_to_console = consolelog;
  }

  /// Returns the current log file.
  std::string get_log_file(void) {
    return log_file;
  }

  /// Returns true if output is being written to stderr
  bool get_log_to_console() {
    return log_to_console;
  }

  /// Returns the current log level
  int get_log_level() {
    return log_level;
  }

  /** Sets the current log level. All logging commands below the current
      log level will not be written. */
  void set_log_level(int new_log_level) {
    log_level = new_log_level;
  }

  file_logger& start_stream(int lineloglevel,const char* file,const char* function, int line);

  template <typename T>
  file_logger& operator<<(T a) {
    logger_impl::streambuff_tls_entry* entry = stream_entry();
    if (entry != NULL && entry->streamactive) entry->streambuffer << a;
    return *this;
  }

  file_logger& operator<<(const char* a) {
    logger_impl::streambuff_tls_entry* entry = stream_entry();
    if (entry != NULL && entry->streamactive) {
      entry->streambuffer << a;
      size_t alen = strlen(a);
      if (alen > 0 && a[alen - 1] == '\n') stream_flush();
    }
    return *this;
  }

  file_logger& operator<<(std::ostream& (*f)(std::ostream&)){
    logger_impl::streambuff_tls_entry* entry = stream_entry();
    if (entry != NULL && entry->streamactive) {
      typedef std::ostream& (*endltype)(std::ostream&);
      if (endltype(f) == endltype(std::endl)) {
        entry->streambuffer << "\n";
        if(entry->streamloglevel == LOG_FATAL) {
          std::string msg = entry->streambuffer.str();
          stream_flush();
          __print_back_trace();
          throw std::runtime_error(msg);
        }
        stream_flush();
      }
    }
    return *this;
  }

  /**
  * logs the message if loglevel>=OUTPUTLEVEL
  * This function should not be used directly. Use logger()
  *
  * @param loglevel Type of message \see LOG_DEBUG LOG_INFO LOG_WARNING LOG_ERROR LOG_FATAL
  * @param file File where the logger call originated
  * @param function Function where the logger call originated
  * @param line Line number where the logger call originated
  * @param fmt printf format string
  * @param arg var args. The parameters that match the format string
  */
  void _log(int loglevel,const char* file,const char* function,
                int line,const char* fmt, va_list arg );

  void _lograw(int loglevel, const char* buf, size_t len);

  void stream_flush() {
    logger_impl::streambuff_tls_entry* entry = stream_entry();
    if (entry != NULL) {
      entry->streambuffer.flush();
      const std::string str = entry->streambuffer.str();
      _lograw(entry->streamloglevel, str.c_str(), str.length());
      entry->streambuffer.str("");
      entry->streamactive = false;
    }
  }

 private:
  logger_impl::streambuff_tls_entry* stream_entry() {
    return reinterpret_cast<logger_impl::streambuff_tls_entry*>(
        pthread_getspecific(streambuffkey));
  }

  std::ofstream fout;
  std::string log_file;

  pthread_key_t streambuffkey;
  pthread_mutex_t mut;

  bool log_to_console;
  int log_level;
};


file_logger& global_logger();

/**
Wrapper to generate 0 code if the output level is lower than the log level
*/
template <bool dostuff>
struct log_dispatch {};

template <>
struct log_dispatch<true> {
  inline static void exec(int loglevel,const char* file,const char* function,
                int line,const char* fmt, ... ) {
    va_list argp;
    va_start(argp, fmt);
    global_logger()._log(loglevel, file, function, line, fmt, argp);
    va_end(argp);
    if (loglevel == LOG_FATAL) {
      __print_back_trace();
      throw std::runtime_error("log fatal");
    }
  }
};

template <>
struct log_dispatch<false> {
  inline static void exec(int loglevel,const char* file,const char* function,
                int line,const char* fmt, ... ) {}
};


struct null_stream {
  template<typename T>
  inline null_stream operator<<(T t) { return null_stream(); }
  inline null_stream operator<<(const char* a) { return null_stream(); }
  inline null_stream operator<<(std::ostream& (*f)(std::ostream&)) { return null_stream(); }
};


template <bool dostuff>
struct log_stream_dispatch {};

template <>
struct log_stream_dispatch<true> {
  inline static file_logger& exec(int lineloglevel,const char* file,const char* function, int line) {
    return global_logger().start_stream(lineloglevel, file, function, line);
  }
};

template <>
struct log_stream_dispatch<false> {
  inline static null_stream exec(int lineloglevel,const char* file,const char* function, int line) {
    return null_stream();
  }
};

#include <bsplab/logger/assertions.hpp>

#endif
