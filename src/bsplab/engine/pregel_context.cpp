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


#include <bsplab/engine/pregel_context.hpp>

#include <bsplab/macros_def.hpp>
namespace bsplab {

  boost::optional<runtime_value>
  node_context::node_property_value(const std::string& key) const {
    const inode_property_values* column = state->graph->node_properties(key);
    if (column == NULL) return boost::none;
    return runtime_value::from_property(*column, nid);
  }


  void compute_context::for_each_neighbor(const neighbor_function_type& fn) const {
    foreach(vertex_id_type target, state->graph->out_neighbors(nid)) fn(target);
  }


  void compute_context::send_to(vertex_id_type target, double value) {
    state->messenger->send_to(nid, target, value);
    mark_sent();
  }


  void compute_context::send_to_neighbors(double value) {
    foreach(vertex_id_type target, state->graph->out_neighbors(nid)) {
      state->messenger->send_to(nid, target, value);
      mark_sent();
    }
  }

} // end of namespace bsplab
#include <bsplab/macros_undef.hpp>
