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


#include <bsplab/schema/node_value.hpp>
#include <bsplab/util/error_types.hpp>
#include <bsplab/logger/assertions.hpp>

#include <bsplab/macros_def.hpp>
namespace bsplab {

  node_value::node_value(const pregel_schema& schema, size_t node_count)
    : m_schema(schema), m_node_count(node_count) {
    columns.resize(schema.size());
    for (size_t i = 0; i < schema.size(); ++i) {
      const pregel_schema_element& elem = schema.elements()[i];
      column& col = columns[i];
      col.type = elem.type;
      const runtime_value init = elem.initial_value();
      switch(elem.type) {
      case value_type::LONG:
        col.longs.assign(node_count, init.as_long());
        break;
      case value_type::DOUBLE:
        col.doubles.assign(node_count, init.as_double());
        break;
      case value_type::LONG_ARRAY:
        col.long_arrays.resize(node_count);
        break;
      case value_type::DOUBLE_ARRAY:
        col.double_arrays.resize(node_count);
        break;
      };
    }
  }


  size_t node_value::checked_column(const std::string& key,
                                    value_type::value_type_enum requested) const {
    const size_t idx = m_schema.index_of(key);
    if (columns[idx].type != requested) {
      throw type_mismatch("Property '" + key + "' is of type " +
                          value_type::to_string(columns[idx].type) +
                          " and cannot be accessed as " +
                          value_type::to_string(requested));
    }
    return idx;
  }


  int64_t node_value::long_value(const std::string& key, vertex_id_type node_id) const {
    const column& col = columns[checked_column(key, value_type::LONG)];
    ASSERT_LT(node_id, m_node_count);
    return col.longs[node_id];
  }

  double node_value::double_value(const std::string& key, vertex_id_type node_id) const {
    const column& col = columns[checked_column(key, value_type::DOUBLE)];
    ASSERT_LT(node_id, m_node_count);
    return col.doubles[node_id];
  }

  const std::vector<int64_t>&
  node_value::long_array_value(const std::string& key, vertex_id_type node_id) const {
    const column& col = columns[checked_column(key, value_type::LONG_ARRAY)];
    ASSERT_LT(node_id, m_node_count);
    return col.long_arrays[node_id];
  }

  const std::vector<double>&
  node_value::double_array_value(const std::string& key, vertex_id_type node_id) const {
    const column& col = columns[checked_column(key, value_type::DOUBLE_ARRAY)];
    ASSERT_LT(node_id, m_node_count);
    return col.double_arrays[node_id];
  }


  void node_value::set_long_value(const std::string& key, vertex_id_type node_id,
                                  int64_t value) {
    column& col = columns[checked_column(key, value_type::LONG)];
    ASSERT_LT(node_id, m_node_count);
    col.longs[node_id] = value;
  }

  void node_value::set_double_value(const std::string& key, vertex_id_type node_id,
                                    double value) {
    column& col = columns[checked_column(key, value_type::DOUBLE)];
    ASSERT_LT(node_id, m_node_count);
    col.doubles[node_id] = value;
  }

  void node_value::set_long_array_value(const std::string& key, vertex_id_type node_id,
                                        const std::vector<int64_t>& value) {
    column& col = columns[checked_column(key, value_type::LONG_ARRAY)];
    ASSERT_LT(node_id, m_node_count);
    col.long_arrays[node_id] = value;
  }

  void node_value::set_double_array_value(const std::string& key, vertex_id_type node_id,
                                          const std::vector<double>& value) {
    column& col = columns[checked_column(key, value_type::DOUBLE_ARRAY)];
    ASSERT_LT(node_id, m_node_count);
    col.double_arrays[node_id] = value;
  }


  runtime_value node_value::row_value(size_t idx, vertex_id_type node_id) const {
    const column& col = columns[idx];
    switch(col.type) {
    case value_type::LONG: return runtime_value::of_long(col.longs[node_id]);
    case value_type::DOUBLE: return runtime_value::of_double(col.doubles[node_id]);
    case value_type::LONG_ARRAY:
      return runtime_value::of_long_array(col.long_arrays[node_id]);
    case value_type::DOUBLE_ARRAY:
      return runtime_value::of_double_array(col.double_arrays[node_id]);
    };
    return runtime_value();
  }


  runtime_value node_value::value(const std::string& key, vertex_id_type node_id) const {
    const size_t idx = m_schema.index_of(key);
    ASSERT_LT(node_id, m_node_count);
    return row_value(idx, node_id);
  }


  void node_value::set_value(const std::string& key, vertex_id_type node_id,
                             const runtime_value& value) {
    const size_t idx = m_schema.index_of(key);
    ASSERT_LT(node_id, m_node_count);
    column& col = columns[idx];
    const runtime_value converted = value.convert_to(col.type);
    switch(col.type) {
    case value_type::LONG: col.longs[node_id] = converted.as_long(); break;
    case value_type::DOUBLE: col.doubles[node_id] = converted.as_double(); break;
    case value_type::LONG_ARRAY:
      col.long_arrays[node_id] = converted.as_long_array();
      break;
    case value_type::DOUBLE_ARRAY:
      col.double_arrays[node_id] = converted.as_double_array();
      break;
    };
  }


  std::vector<std::string> node_value::public_keys() const {
    std::vector<std::string> ret;
    foreach(const pregel_schema_element& e, m_schema.elements()) {
      if (e.is_public()) ret.push_back(e.property_key);
    }
    return ret;
  }


  node_value::property_cursor node_value::properties(const std::string& key) const {
    return property_cursor(this, m_schema.index_of(key));
  }


  bool node_value::property_cursor::next(vertex_id_type& node_id, runtime_value& value) {
    if (pos >= owner->node_count()) return false;
    node_id = pos;
    value = owner->row_value(column, pos);
    ++pos;
    return true;
  }

} // end of namespace bsplab
#include <bsplab/macros_undef.hpp>
