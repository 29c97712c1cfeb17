#include <cmath>
#include <limits>
#include <vector>
#include <cxxtest/TestSuite.h>
#include <bsplab/schema/pregel_schema.hpp>
#include <bsplab/schema/node_value.hpp>
#include <bsplab/schema/runtime_value.hpp>
#include <bsplab/graph/node_property_values.hpp>
#include <bsplab/util/error_types.hpp>

using namespace bsplab;

class SchemaTestSuite : public CxxTest::TestSuite {
public:
  pregel_schema make_schema() {
    return pregel_schema::builder()
      .add_public("rank", value_type::DOUBLE)
      .add("count", value_type::LONG, visibility::PRIVATE)
      .add_with_default("seed", runtime_value::of_long(42))
      .add("path", value_type::LONG_ARRAY)
      .add("weights", value_type::DOUBLE_ARRAY, visibility::PRIVATE)
      .build();
  }

  void test_builder(void) {
    pregel_schema schema = make_schema();
    TS_ASSERT_EQUALS(schema.size(), (size_t)5);
    TS_ASSERT(schema.has_element("rank"));
    TS_ASSERT(!schema.has_element("missing"));
    TS_ASSERT_EQUALS(schema.element("count").type, value_type::LONG);
    TS_ASSERT(!schema.element("count").is_public());
    TS_ASSERT_EQUALS(schema.element("seed").default_value->as_long(), 42);
    TS_ASSERT_EQUALS(schema.index_of("path"), (size_t)3);

    std::vector<std::string> keys = schema.property_keys();
    TS_ASSERT_EQUALS(keys.size(), (size_t)5);
    TS_ASSERT_EQUALS(keys[0], "rank");
    TS_ASSERT_EQUALS(keys[4], "weights");

    std::vector<pregel_schema_element> pub = schema.public_elements();
    TS_ASSERT_EQUALS(pub.size(), (size_t)3);
    TS_ASSERT_EQUALS(pub[1].property_key, "seed");
  }

  void test_builder_rejects(void) {
    pregel_schema::builder b;
    b.add("x", value_type::LONG);
    TS_ASSERT_THROWS(b.add("x", value_type::DOUBLE), schema_error);
    TS_ASSERT_THROWS(b.add_with_default("x", runtime_value::of_double(1.0)), schema_error);
    std::vector<double> arr(2, 1.0);
    TS_ASSERT_THROWS(b.add_with_default("arr", runtime_value::of_double_array(arr)),
                     schema_error);
    TS_ASSERT_THROWS(b.add("", value_type::LONG), schema_error);
    TS_ASSERT_THROWS(b.add_with_property_source("y", value_type::LONG, ""), schema_error);
    TS_ASSERT_THROWS(b.build().element("nope"), schema_key_not_found);
  }

  void test_runtime_value(void) {
    runtime_value l = runtime_value::of_long(7);
    TS_ASSERT_EQUALS(l.type(), value_type::LONG);
    TS_ASSERT_EQUALS(l.as_long(), 7);
    TS_ASSERT_THROWS(l.as_double(), type_mismatch);
    TS_ASSERT_EQUALS(l.convert_to(value_type::DOUBLE).as_double(), 7.0);
    TS_ASSERT_THROWS(runtime_value::of_double(1.5).convert_to(value_type::LONG), type_mismatch);

    std::vector<int64_t> longs;
    longs.push_back(1);
    longs.push_back(2);
    runtime_value la = runtime_value::of_long_array(longs);
    std::vector<double> widened = la.convert_to(value_type::DOUBLE_ARRAY).as_double_array();
    TS_ASSERT_EQUALS(widened.size(), (size_t)2);
    TS_ASSERT_EQUALS(widened[1], 2.0);
    TS_ASSERT_THROWS(la.convert_to(value_type::LONG), type_mismatch);

    TS_ASSERT_EQUALS(runtime_value::default_of(value_type::DOUBLE).as_double(), 0.0);
    TS_ASSERT(runtime_value::default_of(value_type::LONG_ARRAY).as_long_array().empty());
    TS_ASSERT(runtime_value::of_long(3) == runtime_value::of_long(3));
    TS_ASSERT(runtime_value::of_long(3) != runtime_value::of_double(3.0));
  }

  void test_from_property(void) {
    std::vector<int64_t> col;
    col.push_back(5);
    col.push_back(std::numeric_limits<int64_t>::min());
    array_property_values values(col);
    boost::optional<runtime_value> v0 = runtime_value::from_property(values, 0);
    TS_ASSERT(v0);
    TS_ASSERT_EQUALS(v0->as_long(), 5);
    TS_ASSERT(!runtime_value::from_property(values, 1));

    std::vector<double> dcol(2, 0.5);
    dcol[1] = std::numeric_limits<double>::quiet_NaN();
    array_property_values dvalues(dcol);
    TS_ASSERT_EQUALS(runtime_value::from_property(dvalues, 0)->as_double(), 0.5);
    TS_ASSERT(!runtime_value::from_property(dvalues, 1));
    TS_ASSERT_THROWS(dvalues.long_value(0), type_mismatch);
  }

  void test_node_value_defaults(void) {
    node_value values(make_schema(), 10);
    TS_ASSERT_EQUALS(values.node_count(), (size_t)10);
    for (vertex_id_type v = 0; v < 10; ++v) {
      TS_ASSERT_EQUALS(values.double_value("rank", v), 0.0);
      TS_ASSERT_EQUALS(values.long_value("count", v), 0);
      TS_ASSERT_EQUALS(values.long_value("seed", v), 42);
      TS_ASSERT(values.long_array_value("path", v).empty());
      TS_ASSERT(values.double_array_value("weights", v).empty());
    }
  }

  void test_node_value_access(void) {
    node_value values(make_schema(), 4);
    values.set_double_value("rank", 2, 0.25);
    values.set_long_value("count", 3, -9);
    std::vector<int64_t> path(3, 1);
    values.set_long_array_value("path", 1, path);
    std::vector<double> weights(2, 0.5);
    values.set_double_array_value("weights", 0, weights);

    TS_ASSERT_EQUALS(values.double_value("rank", 2), 0.25);
    TS_ASSERT_EQUALS(values.double_value("rank", 1), 0.0);
    TS_ASSERT_EQUALS(values.long_value("count", 3), -9);
    TS_ASSERT_EQUALS(values.long_array_value("path", 1).size(), (size_t)3);
    TS_ASSERT_EQUALS(values.double_array_value("weights", 0)[1], 0.5);

    TS_ASSERT_EQUALS(values.value("rank", 2).as_double(), 0.25);
    values.set_value("rank", 0, runtime_value::of_long(3));
    TS_ASSERT_EQUALS(values.double_value("rank", 0), 3.0);
    TS_ASSERT_THROWS(values.set_value("count", 0, runtime_value::of_double(1.0)),
                     type_mismatch);
  }

  void test_node_value_errors(void) {
    node_value values(make_schema(), 4);
    TS_ASSERT_THROWS(values.long_value("rank", 0), type_mismatch);
    TS_ASSERT_THROWS(values.set_double_value("count", 0, 1.0), type_mismatch);
    TS_ASSERT_THROWS(values.double_value("missing", 0), schema_key_not_found);
    TS_ASSERT_THROWS(values.properties("missing"), schema_key_not_found);
    try {
      values.set_long_value("nokey", 0, 1);
      TS_FAIL("expected schema_key_not_found");
    } catch (const schema_key_not_found& e) {
      TS_ASSERT_EQUALS(e.key(), "nokey");
    }
  }

  void test_properties_cursor(void) {
    node_value values(make_schema(), 3);
    for (vertex_id_type v = 0; v < 3; ++v) values.set_double_value("rank", v, v * 1.5);
    node_value::property_cursor cursor = values.properties("rank");
    TS_ASSERT_EQUALS(cursor.size(), (size_t)3);
    vertex_id_type id;
    runtime_value value;
    size_t n = 0;
    while (cursor.next(id, value)) {
      TS_ASSERT_EQUALS(id, n);
      TS_ASSERT_EQUALS(value.as_double(), n * 1.5);
      ++n;
    }
    TS_ASSERT_EQUALS(n, (size_t)3);

    std::vector<std::string> keys = values.public_keys();
    TS_ASSERT_EQUALS(keys.size(), (size_t)3);
    TS_ASSERT_EQUALS(keys[2], "path");
  }
};
