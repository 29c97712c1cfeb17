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


#ifndef BSPLAB_IMESSENGER_HPP
#define BSPLAB_IMESSENGER_HPP

#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>
#include <bsplab/graph/graph_basic_types.hpp>
#include <bsplab/messaging/messages.hpp>

namespace bsplab {

  /**
   * \brief The message passing layer between vertices.
   *
   * Messages live in generations. send_to() writes into the write
   * generation, readers see the read generation, and init_iteration()
   * turns the write generation into the read generation at the start of
   * each superstep. A message sent in superstep k is therefore read in
   * superstep k+1. The asynchronous messenger relaxes this, see
   * async_queue_messenger.
   *
   * send_to() may be called concurrently from any number of threads.
   * init_iteration() and release() are called by the engine while no
   * compute step runs.
   */
  class imessenger {
  public:
    virtual ~imessenger() { }

    /// Starts superstep iteration. Must precede every send_to() of it.
    virtual void init_iteration(size_t iteration) = 0;

    /// Sends value from source to target
    virtual void send_to(vertex_id_type source, vertex_id_type target, double value) = 0;

    /// A new iterator for init_message_iterator()
    virtual boost::shared_ptr<imessage_iterator> message_iterator() = 0;

    /**
     * Points iter at the messages of node_id. In the first iteration
     * the sequence is always empty.
     */
    virtual void init_message_iterator(imessage_iterator& iter,
                                       vertex_id_type node_id,
                                       bool is_first_iteration) = 0;

    /// The tracked sender of the messages of node_id, if any
    virtual boost::optional<vertex_id_type> sender(vertex_id_type) const {
      return boost::none;
    }

    /// Drops all buffered messages
    virtual void release() = 0;
  };

} // end of namespace bsplab

#endif
