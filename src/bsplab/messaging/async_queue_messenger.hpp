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


#ifndef BSPLAB_ASYNC_QUEUE_MESSENGER_HPP
#define BSPLAB_ASYNC_QUEUE_MESSENGER_HPP

#include <vector>
#include <bsplab/messaging/imessenger.hpp>
#include <bsplab/parallel/pthread_tools.hpp>

namespace bsplab {

  /**
   * \brief Single generation per-vertex message queues.
   *
   * A message is visible as soon as send_to() returns. Initializing the
   * iterator of a vertex takes all its pending messages out of its
   * queue, so every message is read exactly once: in the superstep it
   * was sent in if the target had not been computed yet, otherwise in
   * the next one. Messages sent in the first superstep are read in the
   * second.
   *
   * NaN messages are rejected with invalid_message.
   */
  class async_queue_messenger : public imessenger {
  public:
    async_queue_messenger(size_t node_count, bool track_sender);

    void init_iteration(size_t iteration);
    void send_to(vertex_id_type source, vertex_id_type target, double value);
    boost::shared_ptr<imessage_iterator> message_iterator();
    void init_message_iterator(imessage_iterator& iter, vertex_id_type node_id,
                               bool is_first_iteration);
    boost::optional<vertex_id_type> sender(vertex_id_type node_id) const;
    void release();

  private:
    static const vertex_id_type NO_SENDER = vertex_id_type(-1);

    size_t node_count;
    bool track_sender;
    std::vector<std::vector<double> > queues;
    std::vector<vertex_id_type> senders;
    std::vector<simple_spinlock> locks;
  };

} // end of namespace bsplab

#endif
