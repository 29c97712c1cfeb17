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


#ifndef BSPLAB_NODE_PROPERTY_VALUES_HPP
#define BSPLAB_NODE_PROPERTY_VALUES_HPP

#include <vector>
#include <stdint.h>
#include <bsplab/graph/graph_basic_types.hpp>
#include <bsplab/schema/value_type.hpp>

namespace bsplab {

  /**
   * \brief A read-only, typed node property column of the graph store.
   *
   * Only the accessor matching type() is expected to be called. The
   * others throw type_mismatch.
   */
  class inode_property_values {
  public:
    virtual ~inode_property_values() { }

    /// The type of the values in the column
    virtual value_type::value_type_enum type() const = 0;

    /// The number of nodes covered by the column
    virtual size_t size() const = 0;

    /// False when the node has no value for this property
    virtual bool has_value(vertex_id_type node_id) const = 0;

    virtual int64_t long_value(vertex_id_type node_id) const;
    virtual double double_value(vertex_id_type node_id) const;
    virtual std::vector<int64_t> long_array_value(vertex_id_type node_id) const;
    virtual std::vector<double> double_array_value(vertex_id_type node_id) const;
  };


  /**
   * \brief A property column held in a dense array.
   *
   * A LONG column marks missing values with INT64_MIN, a DOUBLE column
   * with NaN. Array columns have a value for every node.
   */
  class array_property_values : public inode_property_values {
  public:
    explicit array_property_values(const std::vector<int64_t>& values);
    explicit array_property_values(const std::vector<double>& values);
    explicit array_property_values(const std::vector<std::vector<int64_t> >& values);
    explicit array_property_values(const std::vector<std::vector<double> >& values);

    value_type::value_type_enum type() const { return m_type; }
    size_t size() const;
    bool has_value(vertex_id_type node_id) const;

    int64_t long_value(vertex_id_type node_id) const;
    double double_value(vertex_id_type node_id) const;
    std::vector<int64_t> long_array_value(vertex_id_type node_id) const;
    std::vector<double> double_array_value(vertex_id_type node_id) const;

  private:
    value_type::value_type_enum m_type;
    std::vector<int64_t> longs;
    std::vector<double> doubles;
    std::vector<std::vector<int64_t> > long_arrays;
    std::vector<std::vector<double> > double_arrays;
  };

} // end of namespace bsplab

#endif
