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


#ifndef BSPLAB_NODE_VALUE_HPP
#define BSPLAB_NODE_VALUE_HPP

#include <string>
#include <vector>
#include <stdint.h>
#include <bsplab/graph/graph_basic_types.hpp>
#include <bsplab/schema/pregel_schema.hpp>
#include <bsplab/schema/runtime_value.hpp>

namespace bsplab {

  /**
   * \brief The per-vertex state of a Pregel run.
   *
   * One dense array per schema element, each with node_count() rows and
   * every row starting at the element's default value. Different rows
   * may be written concurrently; the same row may not.
   *
   * The typed accessors throw schema_key_not_found for a key that is not
   * in the schema and type_mismatch when the element has another type.
   */
  class node_value {
  public:
    /**
     * Iterates over the (node id, value) pairs of one element in node id
     * order.
     *
     * \code
     *   node_value::property_cursor cursor = values.properties("rank");
     *   vertex_id_type id;
     *   runtime_value v;
     *   while (cursor.next(id, v)) { ... }
     * \endcode
     */
    class property_cursor {
    public:
      /// Moves to the next row. Returns false once all rows have been read.
      bool next(vertex_id_type& node_id, runtime_value& value);
      size_t size() const { return owner->node_count(); }
    private:
      friend class node_value;
      property_cursor(const node_value* owner, size_t column)
        : owner(owner), column(column), pos(0) { }
      const node_value* owner;
      size_t column;
      vertex_id_type pos;
    };

    /// Allocates node_count rows for each element of schema.
    node_value(const pregel_schema& schema, size_t node_count);

    const pregel_schema& schema() const { return m_schema; }
    size_t node_count() const { return m_node_count; }

    int64_t long_value(const std::string& key, vertex_id_type node_id) const;
    double double_value(const std::string& key, vertex_id_type node_id) const;
    const std::vector<int64_t>& long_array_value(const std::string& key,
                                                 vertex_id_type node_id) const;
    const std::vector<double>& double_array_value(const std::string& key,
                                                  vertex_id_type node_id) const;

    void set_long_value(const std::string& key, vertex_id_type node_id, int64_t value);
    void set_double_value(const std::string& key, vertex_id_type node_id, double value);
    void set_long_array_value(const std::string& key, vertex_id_type node_id,
                              const std::vector<int64_t>& value);
    void set_double_array_value(const std::string& key, vertex_id_type node_id,
                                const std::vector<double>& value);

    /// The row of node_id for key, type-erased
    runtime_value value(const std::string& key, vertex_id_type node_id) const;

    /**
     * Stores a type-erased value. A LONG is widened when the element is
     * a DOUBLE (and a LONG_ARRAY for a DOUBLE_ARRAY element), any other
     * difference throws type_mismatch.
     */
    void set_value(const std::string& key, vertex_id_type node_id,
                   const runtime_value& value);

    /// The keys of the PUBLIC elements, in schema order
    std::vector<std::string> public_keys() const;

    /// A cursor over all rows of key
    property_cursor properties(const std::string& key) const;

  private:
    struct column {
      value_type::value_type_enum type;
      std::vector<int64_t> longs;
      std::vector<double> doubles;
      std::vector<std::vector<int64_t> > long_arrays;
      std::vector<std::vector<double> > double_arrays;
    };

    size_t checked_column(const std::string& key,
                          value_type::value_type_enum requested) const;
    runtime_value row_value(size_t column, vertex_id_type node_id) const;

    pregel_schema m_schema;
    size_t m_node_count;
    std::vector<column> columns;
  }; // end of node_value

} // end of namespace bsplab

#endif
