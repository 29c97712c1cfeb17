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


#ifndef BSPLAB_GRAPH_BASIC_TYPES
#define BSPLAB_GRAPH_BASIC_TYPES

#include <stdint.h>

namespace bsplab {
  /// Identifier type of a vertex. Vertex ids are dense in [0, num_vertices).
  typedef uint64_t vertex_id_type;

  /// Identifier type of an edge, an index into the adjacency array.
  typedef uint64_t edge_id_type;
} // end of namespace bsplab

#endif
