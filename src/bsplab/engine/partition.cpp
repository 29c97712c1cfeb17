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
#include <bsplab/engine/partition.hpp>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  namespace {
    const double MIN_PARTITION_CAPACITY = 0.67;
    const double MIN_LAST_PARTITION_CAPACITY = 0.2;
  }

  const size_t partition::SEQUENTIAL_THRESHOLD;
  const size_t partition::DEFAULT_MIN_BATCH_SIZE;


  std::pair<partition, partition> partition::split() const {
    ASSERT_GE(count, 2);
    const size_t left_count = count / 2 + count % 2;
    return std::make_pair(partition(start, left_count),
                          partition(start + left_count, count - left_count));
  }


  std::vector<partition>
  partition::range_partition(size_t concurrency, size_t node_count,
                             size_t min_batch_size) {
    ASSERT_GT(concurrency, 0);
    std::vector<partition> ret;
    if (node_count == 0) return ret;
    const size_t batch_size =
      std::max((node_count + concurrency - 1) / concurrency, min_batch_size);
    for (size_t start = 0; start < node_count; start += batch_size) {
      ret.push_back(partition(start, std::min(batch_size, node_count - start)));
    }
    return ret;
  }


  std::vector<partition>
  partition::degree_partition(const igraph& graph, size_t concurrency,
                              size_t min_batch_size) {
    ASSERT_GT(concurrency, 0);
    std::vector<partition> ret;
    const size_t node_count = graph.num_vertices();
    if (node_count == 0) return ret;
    const size_t target =
      std::max(min_batch_size, (graph.num_edges() + concurrency - 1) / concurrency);

    // a range closes before a vertex that would take it past the target,
    // once it holds MIN_PARTITION_CAPACITY of the target
    const size_t min_degree = size_t(MIN_PARTITION_CAPACITY * target + 0.5);
    std::vector<size_t> degrees;
    size_t start = 0, degree = 0;
    for (size_t v = 0; v < node_count; ++v) {
      const size_t d = graph.out_degree(v);
      if (v > start && degree + d > target && degree >= min_degree) {
        ret.push_back(partition(start, v - start));
        degrees.push_back(degree);
        start = v;
        degree = 0;
      }
      degree += d;
    }
    ret.push_back(partition(start, node_count - start));
    degrees.push_back(degree);

    const size_t min_last_degree = size_t(MIN_LAST_PARTITION_CAPACITY * target + 0.5);
    if (ret.size() > 1 && degrees.back() < min_last_degree) {
      const partition last = ret.back();
      ret.pop_back();
      ret.back() = partition(ret.back().start_node(),
                             ret.back().node_count() + last.node_count());
    }
    return ret;
  }


  std::ostream& operator<<(std::ostream& out, const partition& p) {
    return out << "[" << p.start_node() << ", " << p.end_node() << ")";
  }

} // end of namespace bsplab
