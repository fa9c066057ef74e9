#include "test_common.hpp"

#include <iostream>

void test_parser();
void test_decimal();
void test_escape();
void test_key_encoder();
void test_render();
void test_flatten();
void test_flattener();
void test_random();

static void test_umbrella_example() {
  using namespace jflat;

  const char* json = R"({"a":{"b":1,"c":null,"d":[false,true]},"e":"f","g":2.3})";
  JFLAT_CHECK_EQ(flatten_json(json), R"({"a.b":1,"a.c":null,"a.d[0]":false,"a.d[1]":true,"e":"f","g":2.3})");

  flattener f(json);
  f.with_flatten_mode(flatten_mode::keep_arrays);
  JFLAT_CHECK_EQ(f.flatten(), R"({"a.b":1,"a.c":null,"a.d":[false,true],"e":"f","g":2.3})");
}

int main() {
  test_umbrella_example();
  test_parser();
  test_decimal();
  test_escape();
  test_key_encoder();
  test_render();
  test_flatten();
  test_flattener();
  test_random();

  std::cout << "jflat tests passed\n";
  return 0;
}
