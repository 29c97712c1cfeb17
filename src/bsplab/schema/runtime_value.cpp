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


#include <bsplab/schema/runtime_value.hpp>
#include <bsplab/util/error_types.hpp>

namespace bsplab {

  namespace {
    type_mismatch read_as(value_type::value_type_enum actual,
                          value_type::value_type_enum requested) {
      return type_mismatch("Value of type " + value_type::to_string(actual) +
                           " read as " + value_type::to_string(requested));
    }

    template <typename T>
    void print_array(std::ostream& out, const std::vector<T>& arr) {
      out << "[";
      for (size_t i = 0; i < arr.size(); ++i) {
        if (i > 0) out << ", ";
        out << arr[i];
      }
      out << "]";
    }
  }


  runtime_value runtime_value::default_of(value_type::value_type_enum t) {
    switch(t) {
    case value_type::LONG: return of_long(0);
    case value_type::DOUBLE: return of_double(0.0);
    case value_type::LONG_ARRAY: return of_long_array(std::vector<int64_t>());
    case value_type::DOUBLE_ARRAY: return of_double_array(std::vector<double>());
    };
    return runtime_value();
  }


  value_type::value_type_enum runtime_value::type() const {
    // the variant alternatives are declared in value_type order
    return value_type::value_type_enum(value.which());
  }


  int64_t runtime_value::as_long() const {
    const int64_t* v = boost::get<int64_t>(&value);
    if (v == NULL) throw read_as(type(), value_type::LONG);
    return *v;
  }

  double runtime_value::as_double() const {
    const double* v = boost::get<double>(&value);
    if (v == NULL) throw read_as(type(), value_type::DOUBLE);
    return *v;
  }

  const std::vector<int64_t>& runtime_value::as_long_array() const {
    const std::vector<int64_t>* v = boost::get<std::vector<int64_t> >(&value);
    if (v == NULL) throw read_as(type(), value_type::LONG_ARRAY);
    return *v;
  }

  const std::vector<double>& runtime_value::as_double_array() const {
    const std::vector<double>* v = boost::get<std::vector<double> >(&value);
    if (v == NULL) throw read_as(type(), value_type::DOUBLE_ARRAY);
    return *v;
  }


  runtime_value runtime_value::convert_to(value_type::value_type_enum t) const {
    const value_type::value_type_enum from = type();
    if (from == t) return *this;
    if (from == value_type::LONG && t == value_type::DOUBLE) {
      return of_double(double(as_long()));
    }
    if (from == value_type::LONG_ARRAY && t == value_type::DOUBLE_ARRAY) {
      const std::vector<int64_t>& longs = as_long_array();
      return of_double_array(std::vector<double>(longs.begin(), longs.end()));
    }
    throw type_mismatch("Cannot convert a " + value_type::to_string(from) +
                        " value to " + value_type::to_string(t));
  }


  boost::optional<runtime_value>
  runtime_value::from_property(const inode_property_values& values,
                               vertex_id_type node_id) {
    if (!values.has_value(node_id)) return boost::none;
    switch(values.type()) {
    case value_type::LONG:
      return of_long(values.long_value(node_id));
    case value_type::DOUBLE:
      return of_double(values.double_value(node_id));
    case value_type::LONG_ARRAY:
      return of_long_array(values.long_array_value(node_id));
    case value_type::DOUBLE_ARRAY:
      return of_double_array(values.double_array_value(node_id));
    };
    return boost::none;
  }


  std::ostream& operator<<(std::ostream& out, const runtime_value& v) {
    switch(v.type()) {
    case value_type::LONG: out << v.as_long(); break;
    case value_type::DOUBLE: out << v.as_double(); break;
    case value_type::LONG_ARRAY: print_array(out, v.as_long_array()); break;
    case value_type::DOUBLE_ARRAY: print_array(out, v.as_double_array()); break;
    };
    return out;
  }

} // end of namespace bsplab
