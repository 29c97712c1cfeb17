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


#ifndef BSPLAB_MESSAGES_HPP
#define BSPLAB_MESSAGES_HPP

#include <boost/optional.hpp>
#include <bsplab/graph/graph_basic_types.hpp>

namespace bsplab {

  /**
   * \brief A cursor over the messages delivered to one vertex.
   *
   * Each messenger has its own implementation. An iterator is pointed at
   * a vertex by imessenger::init_message_iterator() and is reused for
   * many vertices by the same compute step.
   */
  class imessage_iterator {
  public:
    virtual ~imessage_iterator() { }

    /// True if there is no message at all, independent of the position
    virtual bool empty() const = 0;

    /// Reads the next message into value. Returns false at the end.
    virtual bool next(double& value) = 0;

    /// Restarts at the first message
    virtual void reset() = 0;

    /// The tracked sender of the messages, if the messenger tracks one
    virtual boost::optional<vertex_id_type> sender() const { return boost::none; }
  };


  /**
   * \brief The messages a vertex receives in a superstep, as seen by the
   * compute function.
   *
   * \code
   *   double msg, min_dist = dist;
   *   while (msgs.next(msg)) min_dist = std::min(min_dist, msg);
   * \endcode
   */
  class messages {
  public:
    /// Wraps iter without taking ownership
    explicit messages(imessage_iterator* iter) : iter(iter) { }

    bool empty() const { return iter->empty(); }
    bool next(double& value) { return iter->next(value); }
    void reset() { iter->reset(); }
    boost::optional<vertex_id_type> sender() const { return iter->sender(); }

    /// The shared, always empty sequence of the initial superstep
    static messages& empty_messages();

  private:
    imessage_iterator* iter;
  };

} // end of namespace bsplab

#endif
