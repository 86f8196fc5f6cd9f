#include "typedjson.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

#ifdef VERBOSE
#  define TRACE(str) (std::cerr << str << std::endl)
#  define TRACEFUNC TRACE(__PRETTY_FUNCTION__)
#else
#  define TRACE(str)
#  define TRACEFUNC
#endif

namespace {

const char* type_name(const typedjson::value& v) {
  switch (v.type()) {
    case typedjson::String:
      return "string";
    case typedjson::Number:
      return "number";
    case typedjson::Boolean:
      return "boolean";
    case typedjson::Object:
      return "object";
    case typedjson::Array:
      return "array";
    case typedjson::Null:
      return "null";
  }
  return "unknown";  // LCOV_EXCL_LINE
}

std::size_t depth(const typedjson::value& v) {
  std::size_t result = 0;
  if (v.type() == typedjson::Array) {
    for (const auto& element : v.as_array()) { result = std::max(result, depth(element)); }
    return result + 1;
  }
  if (v.type() == typedjson::Object) {
    for (const auto& member : v.as_object()) { result = std::max(result, depth(member.second)); }
    return result + 1;
  }
  return result;
}

// One line for the document, then one line per top-level member
void write_summary(std::ostream& out, const typedjson::value& v) {
  TRACEFUNC;

  out << type_name(v);
  if (v.type() == typedjson::Array) {
    out << " with " << v.size() << " elements";
  } else if (v.type() == typedjson::Object) {
    out << " with " << v.size() << " members";
  }
  out << ", depth " << depth(v) << std::endl;

  if (v.type() == typedjson::Object) {
    for (const auto& member : v.as_object()) {
      out << "  \"" << member.first << "\": " << type_name(member.second) << std::endl;
    }
  }
}

int usage(const char* program) {
  std::cerr << "usage: " << program << " [--nesting-limit N] [file]" << std::endl;
  return 2;
}

}  // namespace

int main(int argc, char** argv) {
  typedjson::parse_options options;
  std::string path;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--nesting-limit" && i + 1 < argc) {
      const std::string_view limit = argv[++i];
      const auto [parse_end, error] =
          std::from_chars(limit.data(), limit.data() + limit.size(), options.nesting_limit);
      if (parse_end != limit.data() + limit.size() || error != std::errc()) { return usage(argv[0]); }
    } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
      return usage(argv[0]);
    } else if (path.empty()) {
      path = arg;
    } else {
      return usage(argv[0]);
    }
  }

  std::string json;
  if (path.empty() || path == "-") {
    path = "<stdin>";
    json.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
      std::cerr << path << ": cannot open file" << std::endl;
      return 2;
    }
    json.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  TRACE("read " << json.size() << " bytes from " << path);
  TRACE("nesting limit " << options.nesting_limit);

  try {
    //=================================
    const auto document = typedjson::from_string<typedjson::value>(json, options);
    //=================================
    write_summary(std::cout, document);
  } catch (const typedjson::error& e) {
    if (e.kind() == typedjson::error::FORMAT_ERROR) {
      std::cerr << path << ":" << e.line() << ":" << e.column() << ": " << e.message() << std::endl;
    } else {
      std::cerr << path << ": " << e.what() << std::endl;
    }
    TRACE("error kind " << e.kind());
    return 1;
  } catch (const std::exception& e) {
    std::cerr << path << ": EXCEPTION: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}

/***

$ echo '{"name": "typedjson", "tags": ["json"], "stable": true}' | ./typedjson_check
object with 3 members, depth 2
  "name": string
  "tags": array
  "stable": boolean

$ echo '[1, 2,]' | ./typedjson_check
<stdin>:1:7: expected value

$ echo '[[[]]]' | ./typedjson_check --nesting-limit 2
<stdin>:1:3: exceeded nesting limit (2)

 ***/
