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


#include <boost/bind.hpp>
#include <boost/shared_ptr.hpp>
#include <bsplab/engine/compute_step.hpp>

namespace bsplab {

  compute_step::compute_step(pregel_state& state,
                             const init_function_type& init_fn,
                             const compute_function_type& compute_fn,
                             const partition& part,
                             fork_join_pool* pool,
                             iprogress_tracker& tracker)
    : state(state), init_fn(init_fn), compute_fn(compute_fn), part(part),
      pool(pool), tracker(tracker) { }


  void compute_step::compute() {
    if (pool != NULL && part.can_split()) {
      std::pair<partition, partition> halves = part.split();
      compute_step left(state, init_fn, compute_fn, halves.first, pool, tracker);
      compute_step right(state, init_fn, compute_fn, halves.second, pool, tracker);
      pool->join(boost::bind(&compute_step::compute, &left),
                 boost::bind(&compute_step::compute, &right));
      return;
    }
    if (state.should_stop()) return;
    try {
      compute_batch();
    } catch (...) {
      state.failed = true;
      __sync_synchronize();
      throw;
    }
  }


  void compute_step::compute_batch() {
    const bool first = state.superstep == 0;
    init_context init_ctx(state);
    compute_context compute_ctx(state);
    boost::shared_ptr<imessage_iterator> iter = state.messenger->message_iterator();
    messages msgs(iter.get());
    dense_bitset& vote_bits = *state.vote_bits;

    for (vertex_id_type v = part.start_node(); v < part.end_node(); ++v) {
      if (first) {
        init_ctx.set_node_id(v);
        init_fn(init_ctx);
      }
      state.messenger->init_message_iterator(*iter, v, first);
      const bool has_messages = !msgs.empty();
      if (has_messages || !vote_bits.get(v)) {
        if (has_messages) vote_bits.clear_bit(v);
        compute_ctx.set_node_id(v);
        compute_fn(compute_ctx, first ? messages::empty_messages() : msgs);
      }
    }
    tracker.log_progress(part.node_count());
  }

} // end of namespace bsplab
