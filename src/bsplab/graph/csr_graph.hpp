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


#ifndef BSPLAB_CSR_GRAPH_HPP
#define BSPLAB_CSR_GRAPH_HPP

#include <istream>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <boost/shared_ptr.hpp>
#include <bsplab/graph/igraph.hpp>

namespace bsplab {

  /**
   * Compressed Sparse Row representation of a directed graph.
   *
   * The out-edges of vertex v are ids[index[v] .. index[v+1]), sorted by
   * target. The structure is immutable after construction, node property
   * columns may be attached before the graph is handed to an engine.
   *
   * \code
   *   std::vector<csr_graph::edge_type> edges;
   *   edges.push_back(csr_graph::edge_type(0, 1));
   *   edges.push_back(csr_graph::edge_type(1, 2));
   *   csr_graph graph(3, edges);
   * \endcode
   */
  class csr_graph : public igraph {
  public:
    typedef std::pair<vertex_id_type, vertex_id_type> edge_type;

    /// An empty graph
    csr_graph();

    /** Builds the graph from an edge list. Every endpoint must be smaller
        than num_vertices. Duplicate edges are kept. */
    csr_graph(size_t num_vertices, const std::vector<edge_type>& edges);

    /** Reads "source target" pairs, one per line. Lines starting with
        '#' are skipped. The vertex count is one more than the largest
        id seen, or num_vertices if that is larger. */
    static csr_graph load_edge_list(std::istream& in, size_t num_vertices = 0);

    size_t num_vertices() const { return nverts; }
    size_t num_edges() const { return ids.size(); }
    size_t out_degree(vertex_id_type vid) const;
    neighbor_range_type out_neighbors(vertex_id_type vid) const;
    const inode_property_values* node_properties(const std::string& key) const;

    /// Attaches (or replaces) a node property column
    void add_node_properties(const std::string& key,
                             const boost::shared_ptr<inode_property_values>& values);

  private:
    size_t nverts;
    std::vector<size_t> index;
    std::vector<vertex_id_type> ids;
    std::map<std::string, boost::shared_ptr<inode_property_values> > properties;
  }; // end of csr_graph

} // end of namespace bsplab

#endif
