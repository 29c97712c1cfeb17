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


#include <algorithm>
#include <sstream>
#include <boost/algorithm/string/trim.hpp>
#include <bsplab/graph/csr_graph.hpp>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  csr_graph::csr_graph() : nverts(0), index(1, 0) { }


  csr_graph::csr_graph(size_t num_vertices, const std::vector<edge_type>& edges)
    : nverts(num_vertices), index(num_vertices + 1, 0), ids(edges.size()) {
    // count the out-degrees
    for (size_t i = 0; i < edges.size(); ++i) {
      ASSERT_LT(edges[i].first, nverts);
      ASSERT_LT(edges[i].second, nverts);
      ++index[edges[i].first + 1];
    }
    for (size_t v = 0; v < nverts; ++v) index[v + 1] += index[v];
    // scatter the targets
    std::vector<size_t> cursor(index.begin(), index.end() - 1);
    for (size_t i = 0; i < edges.size(); ++i) {
      ids[cursor[edges[i].first]++] = edges[i].second;
    }
    for (size_t v = 0; v < nverts; ++v) {
      std::sort(ids.begin() + index[v], ids.begin() + index[v + 1]);
    }
  }


  csr_graph csr_graph::load_edge_list(std::istream& in, size_t num_vertices) {
    std::vector<edge_type> edges;
    size_t nverts = num_vertices;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      boost::algorithm::trim(line);
      if (line.empty() || line[0] == '#') continue;
      std::stringstream strm(line);
      vertex_id_type source, target;
      if (!(strm >> source >> target)) {
        logstream(LOG_WARNING) << "Skipping malformed edge on line "
                               << lineno << ": " << line << std::endl;
        continue;
      }
      edges.push_back(edge_type(source, target));
      nverts = std::max(nverts, size_t(std::max(source, target)) + 1);
    }
    logstream(LOG_INFO) << "Loaded " << edges.size() << " edges over "
                        << nverts << " vertices" << std::endl;
    return csr_graph(nverts, edges);
  }


  size_t csr_graph::out_degree(vertex_id_type vid) const {
    ASSERT_LT(vid, nverts);
    return index[vid + 1] - index[vid];
  }


  igraph::neighbor_range_type csr_graph::out_neighbors(vertex_id_type vid) const {
    ASSERT_LT(vid, nverts);
    const vertex_id_type* base = ids.empty() ? NULL : &ids[0];
    return neighbor_range_type(base + index[vid], base + index[vid + 1]);
  }


  const inode_property_values*
  csr_graph::node_properties(const std::string& key) const {
    std::map<std::string, boost::shared_ptr<inode_property_values> >::const_iterator
      i = properties.find(key);
    if (i == properties.end()) return NULL;
    return i->second.get();
  }


  void csr_graph::add_node_properties(const std::string& key,
                                      const boost::shared_ptr<inode_property_values>& values) {
    ASSERT_TRUE(values.get() != NULL);
    if (values->size() != nverts) {
      logstream(LOG_WARNING) << "Property column '" << key << "' covers "
                             << values->size() << " of " << nverts
                             << " vertices" << std::endl;
    }
    properties[key] = values;
  }

} // end of namespace bsplab
