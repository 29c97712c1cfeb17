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


#ifndef BSPLAB_MESSENGER_FACTORY_HPP
#define BSPLAB_MESSENGER_FACTORY_HPP

#include <boost/shared_ptr.hpp>
#include <bsplab/messaging/imessenger.hpp>
#include <bsplab/messaging/message_reducer.hpp>
#include <bsplab/options/pregel_options.hpp>

namespace bsplab {

  /**
   * Picks the messenger of a run: a reducing_messenger when a reducer is
   * given, an async_queue_messenger for asynchronous runs and a
   * sync_queue_messenger otherwise.
   */
  struct messenger_factory {
    static boost::shared_ptr<imessenger>
    create(const pregel_options& config, size_t node_count,
           const boost::shared_ptr<imessage_reducer>& reducer);
  };

} // end of namespace bsplab

#endif
