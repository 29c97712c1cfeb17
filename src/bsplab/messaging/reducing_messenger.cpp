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


#include <bsplab/messaging/reducing_messenger.hpp>
#include <bsplab/parallel/atomic.hpp>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  namespace {
    class single_message_iterator : public imessage_iterator {
    public:
      single_message_iterator() : has_value(false), consumed(false), value(0) { }

      void init(bool has, double v, const boost::optional<vertex_id_type>& snd) {
        has_value = has;
        consumed = false;
        value = v;
        last_sender = snd;
      }

      bool empty() const { return !has_value; }

      bool next(double& out) {
        if (!has_value || consumed) return false;
        out = value;
        consumed = true;
        return true;
      }

      void reset() { consumed = false; }

      boost::optional<vertex_id_type> sender() const { return last_sender; }

    private:
      bool has_value;
      bool consumed;
      double value;
      boost::optional<vertex_id_type> last_sender;
    };
  }


  reducing_messenger::reducing_messenger(size_t node_count,
                                         const boost::shared_ptr<imessage_reducer>& reducer,
                                         bool track_sender)
    : node_count(node_count), m_reducer(reducer), track_sender(track_sender),
      read_gen(0) {
    ASSERT_TRUE(m_reducer);
    const double identity = m_reducer->identity();
    ASSERT_MSG(identity == identity, "the reducer identity must not be NaN");
    for (size_t g = 0; g < 2; ++g) {
      gens[g].values.assign(node_count, identity);
      gens[g].has_message.resize(node_count);
      gens[g].has_message.clear();
      if (track_sender) gens[g].senders.resize(node_count, 0);
    }
    if (track_sender) locks.resize(node_count);
  }


  void reducing_messenger::init_iteration(size_t) {
    read_gen = 1 - read_gen;
    generation& w = write_generation();
    const double identity = m_reducer->identity();
    for (size_t i = 0; i < node_count; ++i) w.values[i] = identity;
    w.has_message.clear();
  }


  void reducing_messenger::send_to(vertex_id_type source, vertex_id_type target,
                                   double value) {
    ASSERT_LT(target, node_count);
    generation& w = write_generation();
    if (track_sender) {
      locks[target].lock();
      const double current = w.values[target];
      const double reduced = m_reducer->reduce(current, value);
      w.values[target] = reduced;
      // the first message always sets the sender
      if (reduced != current || !w.has_message.get(target)) {
        w.senders[target] = source;
      }
      w.has_message.set_bit(target);
      locks[target].unlock();
      return;
    }
    double& slot = w.values[target];
    while (true) {
      const double current = atomic_read(slot);
      const double reduced = m_reducer->reduce(current, value);
      if (atomic_compare_and_swap(slot, current, reduced)) break;
    }
    w.has_message.set_bit(target);
  }


  boost::shared_ptr<imessage_iterator> reducing_messenger::message_iterator() {
    return boost::shared_ptr<imessage_iterator>(new single_message_iterator);
  }


  void reducing_messenger::init_message_iterator(imessage_iterator& iter,
                                                 vertex_id_type node_id,
                                                 bool is_first_iteration) {
    single_message_iterator& siter = static_cast<single_message_iterator&>(iter);
    if (is_first_iteration) {
      siter.init(false, 0, boost::none);
      return;
    }
    const generation& r = read_generation();
    siter.init(r.has_message.get(node_id), r.values[node_id], sender(node_id));
  }


  boost::optional<vertex_id_type>
  reducing_messenger::sender(vertex_id_type node_id) const {
    const generation& r = read_generation();
    if (!track_sender || !r.has_message.get(node_id)) return boost::none;
    return r.senders[node_id];
  }


  void reducing_messenger::release() {
    for (size_t g = 0; g < 2; ++g) {
      std::vector<double>().swap(gens[g].values);
      gens[g].has_message.resize(0);
      std::vector<vertex_id_type>().swap(gens[g].senders);
    }
    std::vector<simple_spinlock>().swap(locks);
    node_count = 0;
  }

} // end of namespace bsplab
