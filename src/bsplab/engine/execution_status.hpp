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


#ifndef BSPLAB_EXECUTION_STATUS_HPP
#define BSPLAB_EXECUTION_STATUS_HPP

#include <string>

namespace bsplab {

  /**
   * \brief the reasons for execution completion.
   *
   * pregel_engine::run() reports why the superstep loop stopped through
   * one of these values.
   */
  struct execution_status {
    enum status_enum {
      EXEC_UNSET,            /**< The engine has not run */
      EXEC_CONVERGED,        /**< Every vertex voted to halt and no message
                                was sent, or master compute stopped the run */
      EXEC_ITERATION_LIMIT,  /**< max_iterations supersteps ran without
                                converging */
      EXEC_TERMINATED        /**< The termination flag was raised */
    }; // end of enum

    // Convenience function.
    static std::string to_string(status_enum es) {
      switch(es) {
      case EXEC_UNSET: return "engine not run!";
      case EXEC_CONVERGED: return "converged";
      case EXEC_ITERATION_LIMIT: return "iteration limit reached";
      case EXEC_TERMINATED: return "terminated";
      };
      return "unknown";
    } // end of to_string
  };

} // end of namespace bsplab
#endif
