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


#ifndef BSPLAB_TERMINATION_FLAG_HPP
#define BSPLAB_TERMINATION_FLAG_HPP

namespace bsplab {

  /**
   * \brief A cooperative cancellation signal.
   *
   * The engine polls its own flag and the process wide global() flag
   * before every superstep and before every batch of vertices. Raising
   * either one stops the run at the next poll; work already done is kept.
   */
  class termination_flag {
  public:
    termination_flag() : flag(false) { }

    /// Requests termination. May be called from any thread.
    void terminate() {
      flag = true;
      __sync_synchronize();
    }

    /// Clears a previous request
    void reset() {
      flag = false;
      __sync_synchronize();
    }

    bool is_terminated() const { return flag; }

    /// The process wide flag, e.g. raised from a signal handler
    static termination_flag& global();

  private:
    volatile bool flag;

    // not implemented
    termination_flag(const termination_flag&);
    termination_flag& operator=(const termination_flag&);
  };

} // end of namespace bsplab
#endif
