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


#ifndef BSPLAB_PREGEL_SCHEMA_HPP
#define BSPLAB_PREGEL_SCHEMA_HPP

#include <map>
#include <ostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <bsplab/schema/value_type.hpp>
#include <bsplab/schema/runtime_value.hpp>

namespace bsplab {

  /**
   * Whether a schema element is part of the result of a run (PUBLIC)
   * or scratch space of the computation (PRIVATE).
   */
  struct visibility {
    enum visibility_enum { PUBLIC, PRIVATE };

    static std::string to_string(visibility_enum v) {
      return v == PUBLIC ? "PUBLIC" : "PRIVATE";
    }
  };


  /**
   * \brief One per-vertex property declared by a computation.
   */
  struct pregel_schema_element {
    std::string property_key;
    value_type::value_type_enum type;
    /// Only scalar elements carry one
    boost::optional<runtime_value> default_value;
    visibility::visibility_enum element_visibility;
    /// The graph node property the element is initialized from
    boost::optional<std::string> property_source;

    pregel_schema_element()
      : type(value_type::LONG), element_visibility(visibility::PUBLIC) { }

    /// The value every row starts with
    runtime_value initial_value() const {
      return default_value ? *default_value : runtime_value::default_of(type);
    }

    bool is_public() const { return element_visibility == visibility::PUBLIC; }
  };

  std::ostream& operator<<(std::ostream& out, const pregel_schema_element& elem);


  /**
   * \brief The immutable set of per-vertex properties of a computation.
   *
   * Elements keep the order in which they were added. A schema is
   * created through a builder:
   *
   * \code
   *   pregel_schema schema = pregel_schema::builder()
   *       .add_public("rank", value_type::DOUBLE)
   *       .add("scratch", value_type::LONG, visibility::PRIVATE)
   *       .build();
   * \endcode
   */
  class pregel_schema {
  public:
    class builder {
    public:
      builder() { }

      /// Adds an element without default value. Throws schema_error on a
      /// duplicate key.
      builder& add(const std::string& key, value_type::value_type_enum type,
                   visibility::visibility_enum vis = visibility::PUBLIC);

      builder& add_public(const std::string& key, value_type::value_type_enum type) {
        return add(key, type, visibility::PUBLIC);
      }

      /**
       * Adds a scalar element initialized to default_value. The element
       * takes the type of the value. An array value is rejected with
       * schema_error.
       */
      builder& add_with_default(const std::string& key,
                                const runtime_value& default_value,
                                visibility::visibility_enum vis = visibility::PUBLIC);

      /// Adds an element filled from the graph node property source_property
      builder& add_with_property_source(const std::string& key,
                                        value_type::value_type_enum type,
                                        const std::string& source_property,
                                        visibility::visibility_enum vis = visibility::PUBLIC);

      pregel_schema build() const;

    private:
      builder& add_element(const pregel_schema_element& elem);
      std::vector<pregel_schema_element> elems;
    };

    /// An empty schema
    pregel_schema() { }

    const std::vector<pregel_schema_element>& elements() const { return elems; }

    size_t size() const { return elems.size(); }

    bool has_element(const std::string& key) const {
      return positions.find(key) != positions.end();
    }

    /// Throws schema_key_not_found for an unknown key
    const pregel_schema_element& element(const std::string& key) const {
      return elems[index_of(key)];
    }

    /// The position of the element in elements(). Throws
    /// schema_key_not_found for an unknown key.
    size_t index_of(const std::string& key) const;

    std::vector<std::string> property_keys() const;

    std::vector<pregel_schema_element> public_elements() const;

  private:
    explicit pregel_schema(const std::vector<pregel_schema_element>& elems);

    std::vector<pregel_schema_element> elems;
    std::map<std::string, size_t> positions;
  };

  std::ostream& operator<<(std::ostream& out, const pregel_schema& schema);

} // end of namespace bsplab

#endif
