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


#include <bsplab/messaging/messenger_factory.hpp>
#include <bsplab/messaging/sync_queue_messenger.hpp>
#include <bsplab/messaging/reducing_messenger.hpp>
#include <bsplab/messaging/async_queue_messenger.hpp>
#include <bsplab/logger/logger.hpp>

namespace bsplab {

  boost::shared_ptr<imessenger>
  messenger_factory::create(const pregel_options& config, size_t node_count,
                            const boost::shared_ptr<imessage_reducer>& reducer) {
    if (reducer) {
      if (config.get_is_asynchronous()) {
        logstream(LOG_WARNING) << "Asynchronous messaging is not available "
                               << "with a reducer. Using a reducing messenger."
                               << std::endl;
      }
      return boost::shared_ptr<imessenger>
        (new reducing_messenger(node_count, reducer, config.get_track_sender()));
    }
    if (config.get_is_asynchronous()) {
      return boost::shared_ptr<imessenger>
        (new async_queue_messenger(node_count, config.get_track_sender()));
    }
    return boost::shared_ptr<imessenger>
      (new sync_queue_messenger(node_count, config.get_track_sender()));
  }

} // end of namespace bsplab
