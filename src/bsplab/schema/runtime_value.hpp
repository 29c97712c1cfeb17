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


#ifndef BSPLAB_RUNTIME_VALUE_HPP
#define BSPLAB_RUNTIME_VALUE_HPP

#include <ostream>
#include <vector>
#include <stdint.h>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <bsplab/graph/graph_basic_types.hpp>
#include <bsplab/graph/node_property_values.hpp>
#include <bsplab/schema/value_type.hpp>

namespace bsplab {

  /**
   * \brief A single type-erased property value.
   *
   * Used for schema defaults, for values read from the graph's node
   * property columns and for values handed out for materialization.
   */
  class runtime_value {
  public:
    typedef boost::variant<int64_t, double,
                           std::vector<int64_t>,
                           std::vector<double> > storage_type;

    /// A LONG zero
    runtime_value() : value(int64_t(0)) { }

    static runtime_value of_long(int64_t v) { return runtime_value(storage_type(v)); }
    static runtime_value of_double(double v) { return runtime_value(storage_type(v)); }
    static runtime_value of_long_array(const std::vector<int64_t>& v) {
      return runtime_value(storage_type(v));
    }
    static runtime_value of_double_array(const std::vector<double>& v) {
      return runtime_value(storage_type(v));
    }

    /// The zero value of a type: 0, 0.0 or an empty array
    static runtime_value default_of(value_type::value_type_enum t);

    value_type::value_type_enum type() const;

    /// Typed readers. Throw type_mismatch unless type() matches.
    int64_t as_long() const;
    double as_double() const;
    const std::vector<int64_t>& as_long_array() const;
    const std::vector<double>& as_double_array() const;

    /**
     * Converts to type t. A LONG widens to DOUBLE and a LONG_ARRAY to
     * DOUBLE_ARRAY. Any other change of type throws type_mismatch.
     */
    runtime_value convert_to(value_type::value_type_enum t) const;

    /**
     * Projects node node_id of a graph property column. Empty when the
     * node has no value in that column.
     */
    static boost::optional<runtime_value>
    from_property(const inode_property_values& values, vertex_id_type node_id);

    bool operator==(const runtime_value& other) const { return value == other.value; }
    bool operator!=(const runtime_value& other) const { return !(value == other.value); }

  private:
    explicit runtime_value(const storage_type& v) : value(v) { }
    storage_type value;
  };

  std::ostream& operator<<(std::ostream& out, const runtime_value& v);

} // end of namespace bsplab

#endif
