#include <vector>
#include <cxxtest/TestSuite.h>
#include <bsplab/engine/partition.hpp>
#include <bsplab/graph/csr_graph.hpp>

using namespace bsplab;

// splits recursively the way the fork-join compute step does
void split_leaves(const partition& p, std::vector<partition>& leaves) {
  if (!p.can_split()) {
    leaves.push_back(p);
    return;
  }
  std::pair<partition, partition> halves = p.split();
  split_leaves(halves.first, leaves);
  split_leaves(halves.second, leaves);
}

void check_covering(const std::vector<partition>& parts, size_t node_count) {
  vertex_id_type expected_start = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    TS_ASSERT_EQUALS(parts[i].start_node(), expected_start);
    TS_ASSERT(parts[i].node_count() > 0);
    expected_start = parts[i].end_node();
  }
  TS_ASSERT_EQUALS(expected_start, (vertex_id_type)node_count);
}


class PartitionTestSuite : public CxxTest::TestSuite {
public:
  void test_split(void) {
    partition p(100, 1001);
    TS_ASSERT(p.can_split());
    std::pair<partition, partition> halves = p.split();
    TS_ASSERT_EQUALS(halves.first.start_node(), (vertex_id_type)100);
    TS_ASSERT_EQUALS(halves.first.node_count(), (size_t)501);
    TS_ASSERT_EQUALS(halves.second.start_node(), (vertex_id_type)601);
    TS_ASSERT_EQUALS(halves.second.node_count(), (size_t)500);
    TS_ASSERT_EQUALS(halves.first.node_count() + halves.second.node_count(),
                     p.node_count());
    TS_ASSERT(!partition(0, 999).can_split());
    TS_ASSERT(partition(0, 1000).can_split());
  }

  void test_repeated_split(void) {
    const size_t sizes[] = {0, 1, 999, 1000, 1001, 4096, 123457};
    for (size_t s = 0; s < 7; ++s) {
      std::vector<partition> leaves;
      split_leaves(partition(0, sizes[s]), leaves);
      size_t total = 0;
      for (size_t i = 0; i < leaves.size(); ++i) {
        TS_ASSERT(leaves[i].node_count() < partition::SEQUENTIAL_THRESHOLD);
        total += leaves[i].node_count();
      }
      TS_ASSERT_EQUALS(total, sizes[s]);
      if (sizes[s] > 0) check_covering(leaves, sizes[s]);
    }
  }

  void test_range_partition(void) {
    std::vector<partition> parts = partition::range_partition(4, 100);
    TS_ASSERT_EQUALS(parts.size(), (size_t)4);
    TS_ASSERT_EQUALS(parts[0].node_count(), (size_t)25);
    check_covering(parts, 100);

    // last batch truncated
    parts = partition::range_partition(3, 100);
    TS_ASSERT_EQUALS(parts.size(), (size_t)3);
    TS_ASSERT_EQUALS(parts[0].node_count(), (size_t)34);
    TS_ASSERT_EQUALS(parts[2].node_count(), (size_t)32);
    check_covering(parts, 100);

    // the minimum batch size wins for small graphs
    parts = partition::range_partition(8, 25);
    TS_ASSERT_EQUALS(parts.size(), (size_t)3);
    TS_ASSERT_EQUALS(parts[0].node_count(), (size_t)10);
    TS_ASSERT_EQUALS(parts[2].node_count(), (size_t)5);
    check_covering(parts, 25);

    TS_ASSERT(partition::range_partition(4, 0).empty());
    TS_ASSERT_EQUALS(partition::range_partition(1, 7).size(), (size_t)1);
  }

  void test_degree_partition(void) {
    // vertex 0 holds most of the edges
    std::vector<csr_graph::edge_type> edges;
    for (size_t i = 0; i < 60; ++i) edges.push_back(csr_graph::edge_type(0, i % 100));
    for (size_t v = 1; v < 100; ++v) edges.push_back(csr_graph::edge_type(v, 0));
    csr_graph graph(100, edges);
    // 159 edges / 4 -> target 40 degrees per partition
    std::vector<partition> parts = partition::degree_partition(graph, 4);
    check_covering(parts, 100);
    TS_ASSERT_EQUALS(parts[0].node_count(), (size_t)1);
    TS_ASSERT_EQUALS(parts[1].node_count(), (size_t)40);
    TS_ASSERT_EQUALS(parts[2].node_count(), (size_t)40);
    // 19 trailing degrees are more than a fifth of 40
    TS_ASSERT_EQUALS(parts.size(), (size_t)4);
    TS_ASSERT_EQUALS(parts[3].node_count(), (size_t)19);
  }

  void test_degree_partition_merges_small_tail(void) {
    // vertex 0 has 44 edges, vertices 1..53 one each: 97 edges, target 25
    std::vector<csr_graph::edge_type> edges;
    for (size_t i = 0; i < 44; ++i) edges.push_back(csr_graph::edge_type(0, 1 + i));
    for (size_t v = 1; v < 54; ++v) edges.push_back(csr_graph::edge_type(v, 0));
    csr_graph graph(54, edges);
    // [0,1) [1,26) [26,51) and a tail [51,54) of 3 degrees
    std::vector<partition> parts = partition::degree_partition(graph, 4);
    TS_ASSERT_EQUALS(parts.size(), (size_t)3);
    TS_ASSERT_EQUALS(parts[0], partition(0, 1));
    TS_ASSERT_EQUALS(parts[1], partition(1, 25));
    TS_ASSERT_EQUALS(parts[2], partition(26, 28));
    check_covering(parts, 54);
  }

  void test_degree_partition_isolates_hub(void) {
    // vertex 0 has degree 8, vertex 1 degree 100, vertices 2..61 degree 1
    std::vector<csr_graph::edge_type> edges;
    for (size_t i = 0; i < 8; ++i) edges.push_back(csr_graph::edge_type(0, 2 + i));
    for (size_t i = 0; i < 100; ++i) edges.push_back(csr_graph::edge_type(1, i % 62));
    for (size_t v = 2; v < 62; ++v) edges.push_back(csr_graph::edge_type(v, 0));
    csr_graph graph(62, edges);
    // 168 edges / 16 -> target 11, a range closes early once it holds 7
    std::vector<partition> parts = partition::degree_partition(graph, 16);
    check_covering(parts, 62);
    TS_ASSERT_EQUALS(parts.size(), (size_t)8);
    TS_ASSERT_EQUALS(parts[0], partition(0, 1));
    TS_ASSERT_EQUALS(parts[1], partition(1, 1));
    for (size_t i = 2; i < 7; ++i) {
      TS_ASSERT_EQUALS(parts[i], partition(2 + (i - 2) * 11, 11));
    }
    TS_ASSERT_EQUALS(parts[7], partition(57, 5));
  }

  void test_degree_partition_keeps_vertices_without_edges(void) {
    std::vector<csr_graph::edge_type> edges;
    for (size_t v = 0; v < 100; ++v) edges.push_back(csr_graph::edge_type(v, 0));
    csr_graph graph(103, edges);
    // target 50: the 3 vertices without edges never exceed it
    std::vector<partition> parts = partition::degree_partition(graph, 2);
    TS_ASSERT_EQUALS(parts.size(), (size_t)2);
    TS_ASSERT_EQUALS(parts[1], partition(50, 53));
    check_covering(parts, 103);
  }

  void test_degree_partition_without_edges(void) {
    csr_graph graph(30, std::vector<csr_graph::edge_type>());
    std::vector<partition> parts = partition::degree_partition(graph, 4);
    TS_ASSERT_EQUALS(parts.size(), (size_t)1);
    check_covering(parts, 30);
  }
};
