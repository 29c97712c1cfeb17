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


#include <bsplab/messaging/sync_queue_messenger.hpp>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  namespace {
    class queue_message_iterator : public imessage_iterator {
    public:
      queue_message_iterator() : queue(NULL), pos(0) { }

      void init(const std::vector<double>* q,
                const boost::optional<vertex_id_type>& snd) {
        queue = q;
        pos = 0;
        last_sender = snd;
      }

      bool empty() const { return queue == NULL || queue->empty(); }

      bool next(double& value) {
        if (queue == NULL || pos >= queue->size()) return false;
        value = (*queue)[pos++];
        return true;
      }

      void reset() { pos = 0; }

      boost::optional<vertex_id_type> sender() const { return last_sender; }

    private:
      const std::vector<double>* queue;
      size_t pos;
      boost::optional<vertex_id_type> last_sender;
    };
  }


  sync_queue_messenger::sync_queue_messenger(size_t node_count, bool track_sender)
    : node_count(node_count), track_sender(track_sender), read_gen(0),
      locks(node_count) {
    for (size_t g = 0; g < 2; ++g) {
      gens[g].queues.resize(node_count);
      if (track_sender) gens[g].senders.resize(node_count, 0);
    }
  }


  void sync_queue_messenger::init_iteration(size_t) {
    read_gen = 1 - read_gen;
    // the old read generation becomes the new write generation
    generation& w = write_generation();
    for (size_t i = 0; i < node_count; ++i) w.queues[i].clear();
  }


  void sync_queue_messenger::send_to(vertex_id_type source, vertex_id_type target,
                                     double value) {
    ASSERT_LT(target, node_count);
    generation& w = write_generation();
    locks[target].lock();
    w.queues[target].push_back(value);
    if (track_sender) w.senders[target] = source;
    locks[target].unlock();
  }


  boost::shared_ptr<imessage_iterator> sync_queue_messenger::message_iterator() {
    return boost::shared_ptr<imessage_iterator>(new queue_message_iterator);
  }


  void sync_queue_messenger::init_message_iterator(imessage_iterator& iter,
                                                   vertex_id_type node_id,
                                                   bool is_first_iteration) {
    queue_message_iterator& qiter = static_cast<queue_message_iterator&>(iter);
    if (is_first_iteration) {
      qiter.init(NULL, boost::none);
      return;
    }
    qiter.init(&read_generation().queues[node_id], sender(node_id));
  }


  boost::optional<vertex_id_type>
  sync_queue_messenger::sender(vertex_id_type node_id) const {
    const generation& r = read_generation();
    if (!track_sender || r.queues[node_id].empty()) return boost::none;
    return r.senders[node_id];
  }


  void sync_queue_messenger::release() {
    for (size_t g = 0; g < 2; ++g) {
      std::vector<std::vector<double> >().swap(gens[g].queues);
      std::vector<vertex_id_type>().swap(gens[g].senders);
    }
    std::vector<simple_spinlock>().swap(locks);
    node_count = 0;
  }

} // end of namespace bsplab
