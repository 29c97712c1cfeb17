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


#ifndef BSPLAB_PREGEL_ENGINE_HPP
#define BSPLAB_PREGEL_ENGINE_HPP

#include <vector>
#include <boost/shared_ptr.hpp>
#include <bsplab/graph/igraph.hpp>
#include <bsplab/options/pregel_options.hpp>
#include <bsplab/schema/node_value.hpp>
#include <bsplab/messaging/imessenger.hpp>
#include <bsplab/util/dense_bitset.hpp>
#include <bsplab/parallel/thread_pool.hpp>
#include <bsplab/parallel/fork_join_pool.hpp>
#include <bsplab/engine/partition.hpp>
#include <bsplab/engine/pregel_state.hpp>
#include <bsplab/engine/progress_tracker.hpp>
#include <bsplab/engine/termination_flag.hpp>
#include <bsplab/engine/ipregel_computation.hpp>
#include <bsplab/engine/pregel_result.hpp>

namespace bsplab {

  /**
   * \brief Runs an ipregel_computation over a graph in synchronous
   * supersteps.
   *
   * Each superstep starts a new message generation, runs the compute
   * steps of all partitions, waits for all of them and then calls the
   * master compute function. The run converges when every vertex voted
   * to halt and no message was sent in the superstep, or when master
   * compute asks to stop. It ends after max_iterations supersteps
   * otherwise.
   *
   * With RANGE or DEGREE partitioning the partitions are computed on a
   * thread_pool, with AUTO one partition covering all vertices is split
   * recursively on a fork_join_pool.
   *
   * \code
   *   pregel_options opts;
   *   opts.set_concurrency(8).set_max_iterations(30);
   *   pagerank computation;
   *   pregel_engine engine(graph, opts, computation);
   *   pregel_result result = engine.run();
   * \endcode
   *
   * An engine runs once. The graph and the computation must outlive it.
   */
  class pregel_engine {
  public:
    /**
     * Validates config (config_error), builds the schema and allocates
     * the Value Store and the messenger.
     */
    pregel_engine(const igraph& graph, const pregel_options& config,
                  ipregel_computation& computation,
                  iprogress_tracker* tracker = NULL);

    /**
     * Runs supersteps until convergence, the iteration limit or
     * termination. Exceptions from user code end the run and are
     * rethrown.
     */
    pregel_result run();

    /// Stops the run at the next poll
    void terminate() { flag.terminate(); }

    termination_flag& get_termination_flag() { return flag; }

    const node_value& node_values() const { return *values; }

    /// The partitions of RANGE and DEGREE runs
    const std::vector<partition>& partitions() const { return parts; }

  private:
    void init_from_property_sources();
    void run_superstep();
    void release();

    const igraph& graph;
    pregel_options config;
    ipregel_computation& computation;

    boost::shared_ptr<node_value> values;
    boost::shared_ptr<imessenger> messenger;
    dense_bitset vote_bits;
    termination_flag flag;
    pregel_state state;

    null_progress_tracker null_tracker;
    iprogress_tracker* tracker;

    std::vector<partition> parts;
    boost::shared_ptr<thread_pool> static_pool;
    boost::shared_ptr<fork_join_pool> fj_pool;

    bool has_run;

    // not implemented
    pregel_engine(const pregel_engine&);
    pregel_engine& operator=(const pregel_engine&);
  };

} // end of namespace bsplab
#endif
