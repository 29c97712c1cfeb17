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


#include <cstdio>
#include <cstring>
#include <iostream>
#include <boost/algorithm/string/case_conv.hpp>
#include <bsplab/logger/logger.hpp>

namespace {

void streambuffdestructor(void* v){
  logger_impl::streambuff_tls_entry* t =
    reinterpret_cast<logger_impl::streambuff_tls_entry*>(v);
  delete t;
}

const char* messages[] = {  "DEBUG:    ",
                            "INFO:     ",
                            "INFO:     ",
                            "WARNING:  ",
                            "ERROR:    ",
                            "FATAL:    "};

#define RESET   0
#define BRIGHT    1
#define DIM   2

#define RED   1
#define GREEN   2
#define YELLOW    3

void textcolor(FILE* handle, int attr, int fg) {
  fprintf(handle, "%c[%d;%dm", 0x1B, attr, fg + 30);
}

void reset_color(FILE* handle) {
  fprintf(handle, "%c[0m", 0x1B);
}

void set_level_color(FILE* handle, int lineloglevel) {
  if (lineloglevel >= LOG_ERROR) {
    textcolor(handle, BRIGHT, RED);
  }
  else if (lineloglevel == LOG_WARNING) {
    textcolor(handle, BRIGHT, YELLOW);
  }
  else if (lineloglevel == LOG_EMPH) {
    textcolor(handle, BRIGHT, GREEN);
  }
}

} // end of anonymous namespace


file_logger& global_logger() {
  static file_logger l;
  return l;
}


int parse_log_level(const std::string& name) {
  const std::string lname = boost::algorithm::to_lower_copy(name);
  if (lname == "debug") return LOG_DEBUG;
  if (lname == "info") return LOG_INFO;
  if (lname == "emph") return LOG_EMPH;
  if (lname == "warning") return LOG_WARNING;
  if (lname == "error") return LOG_ERROR;
  if (lname == "fatal") return LOG_FATAL;
  if (lname == "none") return LOG_NONE;
  return -1;
}


file_logger::file_logger() {
  log_file = "";
  log_to_console = true;
  log_level = LOG_INFO;
  pthread_mutex_init(&mut, NULL);
  pthread_key_create(&streambuffkey, streambuffdestructor);
}

file_logger::~file_logger() {
  if (fout.good()) {
    fout.flush();
    fout.close();
  }
  pthread_mutex_destroy(&mut);
}

bool file_logger::set_log_file(std::string file) {
  pthread_mutex_lock(&mut);
  // close the file if it is open
  if (fout.is_open()) {
    fout.flush();
    fout.close();
    log_file = "";
  }
  bool success = true;
  // if file is not an empty string, open the new file
  if (file.length() > 0) {
    fout.open(file.c_str());
    if (fout.fail()) success = false;
    else log_file = file;
  }
  pthread_mutex_unlock(&mut);
  return success;
}


void file_logger::_log(int lineloglevel,const char* file,const char* function,
                       int line,const char* fmt, va_list ap ){
  if (lineloglevel < log_level || lineloglevel > LOG_FATAL) return;
  // get just the filename
  const char* slash = strrchr(file, '/');
  file = (slash != NULL) ? slash + 1 : file;

  char header[1024];
  int headerlen = snprintf(header, sizeof(header), "%s%s(%s:%d): ",
                           messages[lineloglevel], file, function, line);
  if (headerlen < 0) headerlen = 0;
  if (headerlen >= int(sizeof(header))) headerlen = sizeof(header) - 1;

  va_list apcopy;
  va_copy(apcopy, ap);
  int restlen = vsnprintf(NULL, 0, fmt, apcopy);
  va_end(apcopy);
  if (restlen < 0) restlen = 0;

  std::string str(header, headerlen);
  std::string rest(size_t(restlen) + 1, '\0');
  vsnprintf(&rest[0], rest.size(), fmt, ap);
  rest.resize(restlen);
  str += rest;
  str += "\n";
  _lograw(lineloglevel, str.c_str(), str.length());
}


void file_logger::_lograw(int lineloglevel, const char* buf, size_t len) {
  if (lineloglevel < log_level || lineloglevel > LOG_FATAL) return;
  pthread_mutex_lock(&mut);
  if (fout.is_open() && fout.good()) {
    fout.write(buf, len);
    fout.flush();
  }
  if (log_to_console) {
#ifdef COLOROUTPUT
    set_level_color(stderr, lineloglevel);
#endif
    fwrite(buf, 1, len, stderr);
#ifdef COLOROUTPUT
    reset_color(stderr);
#endif
    fflush(stderr);
  }
  pthread_mutex_unlock(&mut);
}


file_logger& file_logger::start_stream(int lineloglevel,const char* file,
                                       const char* function, int line) {
  // get the stream buffer
  logger_impl::streambuff_tls_entry* entry = stream_entry();
  // create the key if it doesn't exist
  if (entry == NULL) {
    entry = new logger_impl::streambuff_tls_entry;
    pthread_setspecific(streambuffkey, entry);
  }
  // fatal lines are always collected since they throw
  if ((lineloglevel >= log_level && lineloglevel <= LOG_FATAL) ||
      lineloglevel == LOG_FATAL) {
    // get the stream buffer
    std::stringstream& streambuffer = entry->streambuffer;
    // a previous stream that was never terminated is discarded
    streambuffer.str("");
    const char* slash = strrchr(file, '/');
    file = (slash != NULL) ? slash + 1 : file;
    streambuffer << messages[lineloglevel] << file
                 << "(" << function << ":" << line << "): ";
    entry->streamactive = true;
    entry->streamloglevel = lineloglevel;
  }
  else {
    entry->streamactive = false;
  }
  return *this;
}
