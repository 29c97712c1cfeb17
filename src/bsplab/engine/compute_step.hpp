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


#ifndef BSPLAB_COMPUTE_STEP_HPP
#define BSPLAB_COMPUTE_STEP_HPP

#include <boost/function.hpp>
#include <bsplab/engine/partition.hpp>
#include <bsplab/engine/pregel_state.hpp>
#include <bsplab/engine/pregel_context.hpp>
#include <bsplab/engine/progress_tracker.hpp>
#include <bsplab/messaging/messages.hpp>
#include <bsplab/parallel/fork_join_pool.hpp>

namespace bsplab {

  /**
   * \brief Runs one superstep over one partition.
   *
   * For every vertex of the partition the step calls the init function
   * (first superstep only), fetches the messages of the vertex and, if
   * the vertex has messages or has not voted to halt, clears its halt
   * bit and calls the compute function.
   *
   * With a fork_join_pool, partitions of at least
   * partition::SEQUENTIAL_THRESHOLD vertices are split in two and both
   * halves run through fork_join_pool::join(). Without a pool the
   * partition is processed sequentially.
   *
   * An exception from user code marks the run as failed, which makes
   * batches that have not started yet return immediately, and
   * propagates out of compute().
   */
  class compute_step {
  public:
    typedef boost::function<void (init_context&)> init_function_type;
    typedef boost::function<void (compute_context&, messages&)> compute_function_type;

    compute_step(pregel_state& state,
                 const init_function_type& init_fn,
                 const compute_function_type& compute_fn,
                 const partition& part,
                 fork_join_pool* pool,
                 iprogress_tracker& tracker);

    void compute();

    const partition& get_partition() const { return part; }

  private:
    void compute_batch();

    pregel_state& state;
    init_function_type init_fn;
    compute_function_type compute_fn;
    partition part;
    fork_join_pool* pool;
    iprogress_tracker& tracker;
  };

} // end of namespace bsplab
#endif
