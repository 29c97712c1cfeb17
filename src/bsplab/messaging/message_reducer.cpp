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


#include <cfloat>
#include <boost/algorithm/string/case_conv.hpp>
#include <bsplab/messaging/message_reducer.hpp>
#include <bsplab/util/error_types.hpp>

namespace bsplab {

  double min_reducer::identity() const { return DBL_MAX; }

  double max_reducer::identity() const { return -DBL_MAX; }


  std::string reducer_type::to_string(reducer_type_enum r) {
    switch(r) {
    case SUM: return "SUM";
    case MIN: return "MIN";
    case MAX: return "MAX";
    case COUNT: return "COUNT";
    };
    return "UNKNOWN";
  }


  reducer_type::reducer_type_enum reducer_type::parse(const std::string& str) {
    const std::string name = boost::algorithm::to_upper_copy(str);
    if (name == "SUM") return SUM;
    else if (name == "MIN") return MIN;
    else if (name == "MAX") return MAX;
    else if (name == "COUNT") return COUNT;
    throw config_error("Unknown reducer '" + str +
                       "'. Expected one of SUM, MIN, MAX, COUNT");
  }


  boost::shared_ptr<imessage_reducer> reducer_type::create(reducer_type_enum r) {
    switch(r) {
    case SUM: return boost::shared_ptr<imessage_reducer>(new sum_reducer);
    case MIN: return boost::shared_ptr<imessage_reducer>(new min_reducer);
    case MAX: return boost::shared_ptr<imessage_reducer>(new max_reducer);
    case COUNT: return boost::shared_ptr<imessage_reducer>(new count_reducer);
    };
    throw config_error("Unknown reducer type");
  }

} // end of namespace bsplab
