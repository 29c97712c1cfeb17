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


#include <bsplab/messaging/messages.hpp>

namespace bsplab {

  namespace {
    class empty_message_iterator : public imessage_iterator {
    public:
      bool empty() const { return true; }
      bool next(double&) { return false; }
      void reset() { }
    };
  }

  messages& messages::empty_messages() {
    static empty_message_iterator iter;
    static messages msgs(&iter);
    return msgs;
  }

} // end of namespace bsplab
