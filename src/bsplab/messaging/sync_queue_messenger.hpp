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


#ifndef BSPLAB_SYNC_QUEUE_MESSENGER_HPP
#define BSPLAB_SYNC_QUEUE_MESSENGER_HPP

#include <vector>
#include <bsplab/messaging/imessenger.hpp>
#include <bsplab/parallel/pthread_tools.hpp>

namespace bsplab {

  /**
   * \brief Double-buffered per-vertex message queues.
   *
   * Every vertex has a queue in each of the two generations. Appends to
   * the write generation are serialized by a per-vertex spinlock,
   * readers access the read generation without locking.
   */
  class sync_queue_messenger : public imessenger {
  public:
    sync_queue_messenger(size_t node_count, bool track_sender);

    void init_iteration(size_t iteration);
    void send_to(vertex_id_type source, vertex_id_type target, double value);
    boost::shared_ptr<imessage_iterator> message_iterator();
    void init_message_iterator(imessage_iterator& iter, vertex_id_type node_id,
                               bool is_first_iteration);
    boost::optional<vertex_id_type> sender(vertex_id_type node_id) const;
    void release();

  private:
    struct generation {
      std::vector<std::vector<double> > queues;
      // last sender received, only kept with sender tracking
      std::vector<vertex_id_type> senders;
    };

    generation& write_generation() { return gens[1 - read_gen]; }
    const generation& read_generation() const { return gens[read_gen]; }

    size_t node_count;
    bool track_sender;
    generation gens[2];
    size_t read_gen;
    std::vector<simple_spinlock> locks;
  };

} // end of namespace bsplab

#endif
