#include <iostream>
#include <stdexcept>
#include <string>

#include "rapport/util/json.h"

#define RAPPORT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

std::string parse_error_message(const std::string& text) {
  try {
    (void)rapport::json::parse(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

} // namespace

int test_json() {
  namespace json = rapport::json;

  const json::Value v = json::parse(R"({"b": [1, 2.5, true, null], "a": "x\u00e9", "n": -3})");
  RAPPORT_ASSERT(v.is_object());
  RAPPORT_ASSERT(v.at("a").string_value() == "x\xc3\xa9");
  RAPPORT_ASSERT(v.at("n").number_value() == -3.0);
  const auto& arr = v.at("b").array();
  RAPPORT_ASSERT(arr.size() == 4);
  RAPPORT_ASSERT(arr[1].number_value() == 2.5);
  RAPPORT_ASSERT(arr[2].bool_value());
  RAPPORT_ASSERT(arr[3].is_null());
  RAPPORT_ASSERT(v.find("missing") == nullptr);
  RAPPORT_ASSERT(v.at("n").string_value("def") == "def");

  // Keys come out sorted; integral doubles print without a fraction.
  json::Object o;
  o["z"] = 1.0;
  o["a"] = 0.25;
  RAPPORT_ASSERT(json::stringify(o, 0) == R"({"a":0.25,"z":1})");

  // String literals stay strings rather than decaying to bool.
  RAPPORT_ASSERT(json::Value("stranger").is_string());
  RAPPORT_ASSERT(json::stringify(json::Array{json::Value(), true, 2, "a\tb"}, 0) == R"([null,true,2,"a\tb"])");
  RAPPORT_ASSERT(json::stringify(json::Object{}, 2) == "{}");
  RAPPORT_ASSERT(json::stringify(json::parse("{\"k\": [1]}"), 2) == "{\n  \"k\": [\n    1\n  ]\n}");

  // Line and column of a stray comma.
  const std::string msg = parse_error_message("[\n  1,\n  ,\n  2\n]\n");
  RAPPORT_ASSERT(!msg.empty());
  RAPPORT_ASSERT(msg.find("line 3") != std::string::npos);

  RAPPORT_ASSERT(!parse_error_message("{\"a\": }").empty());
  RAPPORT_ASSERT(!parse_error_message("[1, 2] trailing").empty());

  bool threw = false;
  try {
    (void)v.at("nope");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  RAPPORT_ASSERT(threw);

  return 0;
}
