#include "typedjson.hpp"

#include <cassert>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef VERBOSE
#  define TRACE(str) (std::cerr << str << std::endl)
#else
#  define TRACE(str)
#endif

static const char json_obj[] = "{ \"field1\": 42, \"array\" : [ 1, 2, 3 ], \"field2\": \"asd\", "
                               "\"nested\" : { \"field1\" : 42.0, \"field2\" : true, "
                               "\"ignored_field\" : 0, "
                               "\"ignored_object\" : {\"a\":[0]} },"
                               "\"ignored_array\" : [4, 2, {\"a\":5}, [7]] }";

struct nested_type {
  double field1 = 0.0;
  bool field2 = false;
  std::optional<std::string> comment;  // absent: stays empty
};

struct obj_type {
  long long field1 = 0L;
  std::string field2;
  nested_type nested;
  std::vector<long> array;
  int retries = 0;  // absent: defaults to 3
};

namespace typedjson {

template <>
struct struct_description<nested_type> {
  static auto fields() {
    return std::make_tuple(field("field1", &nested_type::field1), field("field2", &nested_type::field2),
                           field("comment", &nested_type::comment));
  }
};

template <>
struct struct_description<obj_type> {
  static auto fields() {
    return std::make_tuple(field("field1", &obj_type::field1), field("field2", &obj_type::field2),
                           field("nested", &obj_type::nested), field("array", &obj_type::array),
                           field("retries", &obj_type::retries).with_default([] { return 3; }));
  }
};

}  // namespace typedjson

int main() {
  //=================================
  std::cout << json_obj << std::endl;
  //=================================

  obj_type obj;
  try {
    //=================================
    obj = typedjson::from_string<obj_type>(json_obj);
    //=================================
  } catch (const typedjson::error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return -1;
  }

  TRACE("field1 " << obj.field1 << ", nested.field1 " << obj.nested.field1);

  //=================================
  std::vector<long> expected = {1, 2, 3};
  assert(obj.field1 == 42LL);
  assert(obj.field2 == "asd");
  assert(obj.nested.field1 == 42.0);
  assert(obj.nested.field2 == true);
  assert(!obj.nested.comment);
  assert(obj.array == expected);
  assert(obj.retries == 3);
  //=================================

  // Shape errors are reported through the same error type as syntax errors
  try {
    typedjson::from_string<obj_type>("{ \"field1\": \"42\" }");
  } catch (const typedjson::error& e) {
    std::cerr << "expected ERROR: " << e.what() << std::endl;
  }

  return 0;
}
