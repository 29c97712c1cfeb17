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


#ifndef BSPLAB_PARTITION_HPP
#define BSPLAB_PARTITION_HPP

#include <ostream>
#include <utility>
#include <vector>
#include <bsplab/graph/igraph.hpp>

namespace bsplab {

  /**
   * \brief A contiguous range of vertex ids processed by one compute step.
   */
  class partition {
  public:
    /// Ranges smaller than this are processed sequentially
    static const size_t SEQUENTIAL_THRESHOLD = 1000;
    static const size_t DEFAULT_MIN_BATCH_SIZE = 10;

    partition() : start(0), count(0) { }
    partition(vertex_id_type start_node, size_t node_count)
      : start(start_node), count(node_count) { }

    vertex_id_type start_node() const { return start; }
    size_t node_count() const { return count; }
    vertex_id_type end_node() const { return start + count; }

    bool can_split() const { return count >= SEQUENTIAL_THRESHOLD; }

    /**
     * Cuts the range in two adjacent halves. The left one gets the odd
     * vertex.
     */
    std::pair<partition, partition> split() const;

    bool operator==(const partition& other) const {
      return start == other.start && count == other.count;
    }

    /**
     * Cuts [0, node_count) into ranges of
     * max(ceil(node_count / concurrency), min_batch_size) vertices. The
     * last range may be shorter.
     */
    static std::vector<partition>
    range_partition(size_t concurrency, size_t node_count,
                    size_t min_batch_size = DEFAULT_MIN_BATCH_SIZE);

    /**
     * Cuts the vertices of graph into ranges of about equal summed
     * out-degree. The target is max(min_batch_size,
     * ceil(num_edges / concurrency)) degrees per range. A range that
     * holds at least 67% of the target is closed before a vertex whose
     * degree would take it past the target, so a high degree vertex
     * starts a range of its own. A last range with less than a fifth of
     * the target is merged into its predecessor.
     */
    static std::vector<partition>
    degree_partition(const igraph& graph, size_t concurrency,
                     size_t min_batch_size = DEFAULT_MIN_BATCH_SIZE);

  private:
    vertex_id_type start;
    size_t count;
  };

  std::ostream& operator<<(std::ostream& out, const partition& p);

} // end of namespace bsplab
#endif
