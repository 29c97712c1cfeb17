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


#ifndef BSPLAB_REDUCING_MESSENGER_HPP
#define BSPLAB_REDUCING_MESSENGER_HPP

#include <vector>
#include <boost/shared_ptr.hpp>
#include <bsplab/messaging/imessenger.hpp>
#include <bsplab/messaging/message_reducer.hpp>
#include <bsplab/parallel/pthread_tools.hpp>
#include <bsplab/util/dense_bitset.hpp>

namespace bsplab {

  /**
   * \brief A messenger that folds all messages to a vertex into one
   * value as they arrive.
   *
   * Every vertex has one double slot per generation. Without sender
   * tracking the slot is updated with a compare-and-swap loop. With
   * sender tracking the slot and its sender are updated together under
   * a per-vertex spinlock, and the sender is replaced only when the
   * message changed the reduced value.
   *
   * A vertex receives a message iff at least one message was sent to it,
   * even when the reduced value equals the identity.
   */
  class reducing_messenger : public imessenger {
  public:
    reducing_messenger(size_t node_count,
                       const boost::shared_ptr<imessage_reducer>& reducer,
                       bool track_sender);

    void init_iteration(size_t iteration);
    void send_to(vertex_id_type source, vertex_id_type target, double value);
    boost::shared_ptr<imessage_iterator> message_iterator();
    void init_message_iterator(imessage_iterator& iter, vertex_id_type node_id,
                               bool is_first_iteration);
    boost::optional<vertex_id_type> sender(vertex_id_type node_id) const;
    void release();

    const imessage_reducer& reducer() const { return *m_reducer; }

  private:
    struct generation {
      std::vector<double> values;
      dense_bitset has_message;
      std::vector<vertex_id_type> senders;
    };

    generation& write_generation() { return gens[1 - read_gen]; }
    const generation& read_generation() const { return gens[read_gen]; }

    size_t node_count;
    boost::shared_ptr<imessage_reducer> m_reducer;
    bool track_sender;
    generation gens[2];
    size_t read_gen;
    std::vector<simple_spinlock> locks;
  };

} // end of namespace bsplab

#endif
