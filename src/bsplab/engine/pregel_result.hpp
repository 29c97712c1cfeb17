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


#ifndef BSPLAB_PREGEL_RESULT_HPP
#define BSPLAB_PREGEL_RESULT_HPP

#include <boost/shared_ptr.hpp>
#include <bsplab/schema/node_value.hpp>
#include <bsplab/engine/execution_status.hpp>

namespace bsplab {

  /**
   * \brief The outcome of a pregel_engine run: the final Value Store
   * and why the run stopped.
   */
  class pregel_result {
  public:
    pregel_result(const boost::shared_ptr<node_value>& values,
                  execution_status::status_enum status,
                  size_t ran_iterations)
      : values(values), status(status), iterations(ran_iterations) { }

    const node_value& node_values() const { return *values; }
    boost::shared_ptr<node_value> shared_node_values() const { return values; }

    execution_status::status_enum get_status() const { return status; }
    bool did_converge() const { return status == execution_status::EXEC_CONVERGED; }

    /// The number of supersteps executed
    size_t ran_iterations() const { return iterations; }

    /// The index of the last superstep executed. 0 if none ran.
    size_t last_iteration() const { return iterations == 0 ? 0 : iterations - 1; }

  private:
    boost::shared_ptr<node_value> values;
    execution_status::status_enum status;
    size_t iterations;
  };

} // end of namespace bsplab
#endif
