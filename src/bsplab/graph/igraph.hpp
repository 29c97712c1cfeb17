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


/**
 * \file
 *
 * The graph interface the Pregel engine computes over. The engine only
 * reads topology and node property columns through it, never the
 * storage format behind it.
 */
#ifndef BSPLAB_IGRAPH_HPP
#define BSPLAB_IGRAPH_HPP

#include <string>
#include <boost/range/iterator_range.hpp>
#include <bsplab/graph/graph_basic_types.hpp>
#include <bsplab/graph/node_property_values.hpp>

namespace bsplab {

  /**
   * \brief Read-only view of a directed graph with dense vertex ids.
   *
   * Implementations must allow concurrent calls from many threads.
   */
  class igraph {
  public:
    /// A contiguous range of out-neighbor ids
    typedef boost::iterator_range<const vertex_id_type*> neighbor_range_type;

    virtual ~igraph() { }

    /// The number of vertices. Ids are [0, num_vertices()).
    virtual size_t num_vertices() const = 0;

    /// The number of directed edges
    virtual size_t num_edges() const = 0;

    /// The number of out-edges of vertex vid
    virtual size_t out_degree(vertex_id_type vid) const = 0;

    /// The targets of the out-edges of vertex vid
    virtual neighbor_range_type out_neighbors(vertex_id_type vid) const = 0;

    /// The node property column called key, or NULL if there is none
    virtual const inode_property_values* node_properties(const std::string& key) const = 0;
  };

} // end of namespace bsplab

#endif
