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


#include <bsplab/engine/progress_tracker.hpp>
#include <bsplab/logger/logger.hpp>

namespace bsplab {

  void logging_progress_tracker::begin_task(const std::string& name, size_t vol) {
    task_name = name;
    volume = vol;
    done.value = 0;
    last_decile.value = 0;
    ti.start();
    logstream(LOG_DEBUG) << task_name << " :: Start" << std::endl;
  }


  void logging_progress_tracker::log_progress(size_t units) {
    const size_t total = done.inc(units);
    if (volume == 0) return;
    const size_t decile = (10 * total) / volume;
    size_t prev = last_decile.value;
    // only the thread that moves the decile forward reports it
    while (decile > prev) {
      if (atomic_compare_and_swap(last_decile.value, prev, decile)) {
        logstream(LOG_INFO) << task_name << " " << 10 * decile << "%" << std::endl;
        break;
      }
      prev = last_decile.value;
    }
  }


  void logging_progress_tracker::end_task() {
    logstream(LOG_DEBUG) << task_name << " :: Finished after "
                         << ti.current_time() << "s" << std::endl;
  }

} // end of namespace bsplab
