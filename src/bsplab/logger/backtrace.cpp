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


#include <execinfo.h>
#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <cxxabi.h>
#include <pthread.h>
#include <string>

namespace {

/** Demangles one line of backtrace_symbols() output. */
std::string demangle(const char* symbol) {
  size_t size;
  int status;
  char temp[1024];
  char* demangled;
  // first, try to demangle a c++ name
  if (1 == sscanf(symbol, "%*[^(]%*[^_]%1023[^)+]", temp)) {
    if (NULL != (demangled = abi::__cxa_demangle(temp, NULL, &size, &status))) {
      std::string result(demangled);
      free(demangled);
      return result;
    }
  }
  // if that didn't work, try to get a regular c symbol
  if (1 == sscanf(symbol, "%1023s", temp)) {
    return temp;
  }
  // if all else fails, just return the symbol
  return symbol;
}

pthread_mutex_t back_trace_file_lock = PTHREAD_MUTEX_INITIALIZER;
size_t write_count = 0;
bool write_error = false;
int backtrace_file_number = 0;

} // end of anonymous namespace


void __set_back_trace_file_number(int number) {
  pthread_mutex_lock(&back_trace_file_lock);
  backtrace_file_number = number;
  write_count = 0;
  pthread_mutex_unlock(&back_trace_file_lock);
}

/* Obtain a backtrace and append it to backtrace.<number>. */
void __print_back_trace() {
  void    *array[1024];
  int     size, i;
  char    **strings;

  pthread_mutex_lock(&back_trace_file_lock);

  if (write_error) {
    pthread_mutex_unlock(&back_trace_file_lock);
    return;
  }
  char filename[64];
  snprintf(filename, sizeof(filename), "backtrace.%d", backtrace_file_number);

  FILE* ofile = fopen(filename, write_count == 0 ? "w" : "a");
  // if unable to open the file for output
  if (ofile == NULL) {
    // print an error, set the error flag so we don't ever print it again
    fprintf(stderr, "Unable to open output backtrace file.\n");
    write_error = true;
    pthread_mutex_unlock(&back_trace_file_lock);
    return;
  }
  ++write_count;

  size = backtrace(array, 1024);
  strings = backtrace_symbols(array, size);

  fprintf(ofile, "Raw\n");
  fprintf(ofile, "------------\n");
  for (i = 0; i < size; ++i) {
    fprintf(ofile, "%s\n", strings[i]);
  }
  fprintf(ofile, "\nDemangled\n");
  fprintf(ofile, "------------\n");
  for (i = 0; i < size; ++i) {
    std::string ret = demangle(strings[i]);
    fprintf(ofile, "%s\n", ret.c_str());
  }
  free(strings);

  fprintf(ofile, "-------------------------------------------------------\n");
  fprintf(ofile, "\n\n");

  fclose(ofile);
  pthread_mutex_unlock(&back_trace_file_lock);
}
