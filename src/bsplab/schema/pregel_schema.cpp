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


#include <bsplab/schema/pregel_schema.hpp>
#include <bsplab/util/error_types.hpp>

#include <bsplab/macros_def.hpp>
namespace bsplab {

  pregel_schema::builder&
  pregel_schema::builder::add_element(const pregel_schema_element& elem) {
    if (elem.property_key.empty()) {
      throw schema_error("Schema elements need a non-empty property key");
    }
    foreach(const pregel_schema_element& e, elems) {
      if (e.property_key == elem.property_key) {
        throw schema_error("Duplicate schema element '" + elem.property_key + "'");
      }
    }
    elems.push_back(elem);
    return *this;
  }


  pregel_schema::builder&
  pregel_schema::builder::add(const std::string& key,
                              value_type::value_type_enum type,
                              visibility::visibility_enum vis) {
    pregel_schema_element elem;
    elem.property_key = key;
    elem.type = type;
    elem.element_visibility = vis;
    return add_element(elem);
  }


  pregel_schema::builder&
  pregel_schema::builder::add_with_default(const std::string& key,
                                           const runtime_value& default_value,
                                           visibility::visibility_enum vis) {
    if (value_type::is_array(default_value.type())) {
      throw schema_error("Element '" + key + "': array elements cannot have a default value");
    }
    pregel_schema_element elem;
    elem.property_key = key;
    elem.type = default_value.type();
    elem.default_value = default_value;
    elem.element_visibility = vis;
    return add_element(elem);
  }


  pregel_schema::builder&
  pregel_schema::builder::add_with_property_source(const std::string& key,
                                                   value_type::value_type_enum type,
                                                   const std::string& source_property,
                                                   visibility::visibility_enum vis) {
    if (source_property.empty()) {
      throw schema_error("Element '" + key + "': empty property source");
    }
    pregel_schema_element elem;
    elem.property_key = key;
    elem.type = type;
    elem.element_visibility = vis;
    elem.property_source = source_property;
    return add_element(elem);
  }


  pregel_schema pregel_schema::builder::build() const {
    return pregel_schema(elems);
  }


  pregel_schema::pregel_schema(const std::vector<pregel_schema_element>& elems)
    : elems(elems) {
    for (size_t i = 0; i < elems.size(); ++i) {
      positions[elems[i].property_key] = i;
    }
  }


  size_t pregel_schema::index_of(const std::string& key) const {
    std::map<std::string, size_t>::const_iterator iter = positions.find(key);
    if (iter == positions.end()) throw schema_key_not_found(key);
    return iter->second;
  }


  std::vector<std::string> pregel_schema::property_keys() const {
    std::vector<std::string> ret;
    foreach(const pregel_schema_element& e, elems) ret.push_back(e.property_key);
    return ret;
  }


  std::vector<pregel_schema_element> pregel_schema::public_elements() const {
    std::vector<pregel_schema_element> ret;
    foreach(const pregel_schema_element& e, elems) {
      if (e.is_public()) ret.push_back(e);
    }
    return ret;
  }


  std::ostream& operator<<(std::ostream& out, const pregel_schema_element& elem) {
    out << elem.property_key << ": " << value_type::to_string(elem.type)
        << " " << visibility::to_string(elem.element_visibility);
    if (elem.default_value) out << " default=" << *elem.default_value;
    if (elem.property_source) out << " source=" << *elem.property_source;
    return out;
  }


  std::ostream& operator<<(std::ostream& out, const pregel_schema& schema) {
    out << "{";
    for (size_t i = 0; i < schema.elements().size(); ++i) {
      if (i > 0) out << ", ";
      out << schema.elements()[i];
    }
    return out << "}";
  }

} // end of namespace bsplab
#include <bsplab/macros_undef.hpp>
