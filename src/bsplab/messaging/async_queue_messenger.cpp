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


#include <boost/lexical_cast.hpp>
#include <bsplab/messaging/async_queue_messenger.hpp>
#include <bsplab/util/error_types.hpp>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  namespace {
    // owns the drained messages of one vertex
    class drained_message_iterator : public imessage_iterator {
    public:
      drained_message_iterator() : pos(0) { }

      std::vector<double>& buffer() { return values; }

      void init(const boost::optional<vertex_id_type>& snd) {
        pos = 0;
        last_sender = snd;
      }

      bool empty() const { return values.empty(); }

      bool next(double& value) {
        if (pos >= values.size()) return false;
        value = values[pos++];
        return true;
      }

      void reset() { pos = 0; }

      boost::optional<vertex_id_type> sender() const { return last_sender; }

    private:
      std::vector<double> values;
      size_t pos;
      boost::optional<vertex_id_type> last_sender;
    };
  }


  const vertex_id_type async_queue_messenger::NO_SENDER;


  async_queue_messenger::async_queue_messenger(size_t node_count, bool track_sender)
    : node_count(node_count), track_sender(track_sender),
      queues(node_count), locks(node_count) {
    if (track_sender) senders.resize(node_count, NO_SENDER);
  }


  void async_queue_messenger::init_iteration(size_t) { }


  void async_queue_messenger::send_to(vertex_id_type source, vertex_id_type target,
                                      double value) {
    if (value != value) {
      throw invalid_message("NaN message from node " +
                            boost::lexical_cast<std::string>(source) +
                            " to node " + boost::lexical_cast<std::string>(target));
    }
    ASSERT_LT(target, node_count);
    locks[target].lock();
    queues[target].push_back(value);
    if (track_sender) senders[target] = source;
    locks[target].unlock();
  }


  boost::shared_ptr<imessage_iterator> async_queue_messenger::message_iterator() {
    return boost::shared_ptr<imessage_iterator>(new drained_message_iterator);
  }


  void async_queue_messenger::init_message_iterator(imessage_iterator& iter,
                                                    vertex_id_type node_id,
                                                    bool is_first_iteration) {
    drained_message_iterator& diter = static_cast<drained_message_iterator&>(iter);
    std::vector<double>& buffer = diter.buffer();
    buffer.clear();
    if (is_first_iteration) {
      diter.init(boost::none);
      return;
    }
    boost::optional<vertex_id_type> snd;
    locks[node_id].lock();
    buffer.swap(queues[node_id]);
    if (!buffer.empty()) snd = sender(node_id);
    locks[node_id].unlock();
    diter.init(snd);
  }


  boost::optional<vertex_id_type>
  async_queue_messenger::sender(vertex_id_type node_id) const {
    if (!track_sender || senders[node_id] == NO_SENDER) return boost::none;
    return senders[node_id];
  }


  void async_queue_messenger::release() {
    std::vector<std::vector<double> >().swap(queues);
    std::vector<vertex_id_type>().swap(senders);
    std::vector<simple_spinlock>().swap(locks);
    node_count = 0;
  }

} // end of namespace bsplab
