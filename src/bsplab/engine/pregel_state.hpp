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


#ifndef BSPLAB_PREGEL_STATE_HPP
#define BSPLAB_PREGEL_STATE_HPP

#include <bsplab/graph/igraph.hpp>
#include <bsplab/schema/node_value.hpp>
#include <bsplab/messaging/imessenger.hpp>
#include <bsplab/options/pregel_options.hpp>
#include <bsplab/util/dense_bitset.hpp>
#include <bsplab/engine/termination_flag.hpp>

namespace bsplab {

  /**
   * \internal
   * The state of a run shared by the engine, its compute steps and the
   * contexts handed to user code. Owned by the engine.
   */
  struct pregel_state {
    const igraph* graph;
    const pregel_options* config;
    node_value* values;
    imessenger* messenger;
    /// one bit per vertex, set when the vertex voted to halt
    dense_bitset* vote_bits;
    const termination_flag* engine_flag;

    size_t superstep;
    /// set by the first message of a superstep, cleared by the engine
    volatile bool message_sent;
    /// set when a compute step failed, later batches are skipped
    volatile bool failed;

    pregel_state()
      : graph(NULL), config(NULL), values(NULL), messenger(NULL),
        vote_bits(NULL), engine_flag(NULL), superstep(0),
        message_sent(false), failed(false) { }

    bool terminated() const {
      return (engine_flag != NULL && engine_flag->is_terminated()) ||
        termination_flag::global().is_terminated();
    }

    /// True if the current batch should not start
    bool should_stop() const { return failed || terminated(); }
  };

} // end of namespace bsplab
#endif
