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


#ifndef BSPLAB_IPREGEL_COMPUTATION_HPP
#define BSPLAB_IPREGEL_COMPUTATION_HPP

#include <boost/shared_ptr.hpp>
#include <bsplab/schema/pregel_schema.hpp>
#include <bsplab/messaging/messages.hpp>
#include <bsplab/messaging/message_reducer.hpp>
#include <bsplab/engine/pregel_context.hpp>
#include <bsplab/options/pregel_options.hpp>

namespace bsplab {

  /**
   * \brief A vertex-centric algorithm run by the pregel_engine.
   *
   * schema() declares the per-vertex state. init() runs once for every
   * vertex at the start of the first superstep, compute() runs for every
   * active vertex in every superstep. Both are called concurrently for
   * different vertices and must only write the row of their own vertex.
   *
   * \code
   * class min_label : public ipregel_computation {
   *   pregel_schema schema(const pregel_options&) const {
   *     return pregel_schema::builder().add_public("label", value_type::LONG).build();
   *   }
   *   void init(init_context& ctx) {
   *     ctx.set_long_node_value("label", ctx.node_id());
   *   }
   *   void compute(compute_context& ctx, messages& msgs) {
   *     ...
   *     ctx.vote_to_halt();
   *   }
   * };
   * \endcode
   */
  class ipregel_computation {
  public:
    virtual ~ipregel_computation() { }

    /// The per-vertex state of the computation
    virtual pregel_schema schema(const pregel_options& config) const = 0;

    virtual void init(init_context&) { }

    virtual void compute(compute_context& context, messages& msgs) = 0;

    /**
     * Runs single threaded after every superstep. Returning true stops
     * the run as converged.
     */
    virtual bool master_compute(master_compute_context&) { return false; }

    /// A reducer folds all messages to a vertex into one. None by default.
    virtual boost::shared_ptr<imessage_reducer> reducer() const {
      return boost::shared_ptr<imessage_reducer>();
    }

    /// Called once when the run is over, also after a failure
    virtual void close() { }
  };

} // end of namespace bsplab
#endif
