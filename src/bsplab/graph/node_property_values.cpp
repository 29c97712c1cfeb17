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


#include <cmath>
#include <limits>
#include <bsplab/graph/node_property_values.hpp>
#include <bsplab/util/error_types.hpp>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  namespace {
    type_mismatch wrong_accessor(value_type::value_type_enum actual,
                                 value_type::value_type_enum requested) {
      return type_mismatch("Property column of type " +
                           value_type::to_string(actual) +
                           " read as " + value_type::to_string(requested));
    }
  }

  int64_t inode_property_values::long_value(vertex_id_type) const {
    throw wrong_accessor(type(), value_type::LONG);
  }

  double inode_property_values::double_value(vertex_id_type) const {
    throw wrong_accessor(type(), value_type::DOUBLE);
  }

  std::vector<int64_t>
  inode_property_values::long_array_value(vertex_id_type) const {
    throw wrong_accessor(type(), value_type::LONG_ARRAY);
  }

  std::vector<double>
  inode_property_values::double_array_value(vertex_id_type) const {
    throw wrong_accessor(type(), value_type::DOUBLE_ARRAY);
  }


  array_property_values::array_property_values(const std::vector<int64_t>& values)
    : m_type(value_type::LONG), longs(values) { }

  array_property_values::array_property_values(const std::vector<double>& values)
    : m_type(value_type::DOUBLE), doubles(values) { }

  array_property_values::array_property_values(
      const std::vector<std::vector<int64_t> >& values)
    : m_type(value_type::LONG_ARRAY), long_arrays(values) { }

  array_property_values::array_property_values(
      const std::vector<std::vector<double> >& values)
    : m_type(value_type::DOUBLE_ARRAY), double_arrays(values) { }

  size_t array_property_values::size() const {
    switch(m_type) {
    case value_type::LONG: return longs.size();
    case value_type::DOUBLE: return doubles.size();
    case value_type::LONG_ARRAY: return long_arrays.size();
    case value_type::DOUBLE_ARRAY: return double_arrays.size();
    };
    return 0;
  }

  bool array_property_values::has_value(vertex_id_type node_id) const {
    if (node_id >= size()) return false;
    switch(m_type) {
    case value_type::LONG:
      return longs[node_id] != std::numeric_limits<int64_t>::min();
    case value_type::DOUBLE:
      return !std::isnan(doubles[node_id]);
    default:
      return true;
    };
  }

  int64_t array_property_values::long_value(vertex_id_type node_id) const {
    if (m_type != value_type::LONG) return inode_property_values::long_value(node_id);
    ASSERT_LT(node_id, longs.size());
    return longs[node_id];
  }

  double array_property_values::double_value(vertex_id_type node_id) const {
    if (m_type != value_type::DOUBLE) return inode_property_values::double_value(node_id);
    ASSERT_LT(node_id, doubles.size());
    return doubles[node_id];
  }

  std::vector<int64_t>
  array_property_values::long_array_value(vertex_id_type node_id) const {
    if (m_type != value_type::LONG_ARRAY) {
      return inode_property_values::long_array_value(node_id);
    }
    ASSERT_LT(node_id, long_arrays.size());
    return long_arrays[node_id];
  }

  std::vector<double>
  array_property_values::double_array_value(vertex_id_type node_id) const {
    if (m_type != value_type::DOUBLE_ARRAY) {
      return inode_property_values::double_array_value(node_id);
    }
    ASSERT_LT(node_id, double_arrays.size());
    return double_arrays[node_id];
  }

} // end of namespace bsplab
