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


#ifndef BSPLAB_PROGRESS_TRACKER_HPP
#define BSPLAB_PROGRESS_TRACKER_HPP

#include <string>
#include <bsplab/parallel/atomic.hpp>
#include <bsplab/parallel/pthread_tools.hpp>
#include <bsplab/util/timer.hpp>

namespace bsplab {

  /**
   * \brief Receives progress reports of a run.
   *
   * begin_task() and end_task() bracket one superstep and are called by
   * the engine thread. log_progress() is called concurrently by the
   * compute steps, once per finished batch with the number of vertices
   * it covered.
   */
  class iprogress_tracker {
  public:
    virtual ~iprogress_tracker() { }
    virtual void begin_task(const std::string& name, size_t volume) = 0;
    virtual void log_progress(size_t units) = 0;
    virtual void end_task() = 0;
  };


  /// Ignores all reports
  class null_progress_tracker : public iprogress_tracker {
  public:
    void begin_task(const std::string&, size_t) { }
    void log_progress(size_t) { }
    void end_task() { }
  };


  /**
   * Logs at LOG_INFO whenever another tenth of the task volume is done,
   * and the task duration at its end.
   */
  class logging_progress_tracker : public iprogress_tracker {
  public:
    logging_progress_tracker() : volume(0), done(0), last_decile(0) { }

    void begin_task(const std::string& name, size_t volume);
    void log_progress(size_t units);
    void end_task();

    /// The units reported since the last begin_task()
    size_t progress() const { return done.value; }

  private:
    std::string task_name;
    size_t volume;
    atomic<size_t> done;
    atomic<size_t> last_decile;
    timer ti;
  };

} // end of namespace bsplab
#endif
