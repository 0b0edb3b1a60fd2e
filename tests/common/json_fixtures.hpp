#ifndef FRAMEWATCH_TESTS_COMMON_JSON_FIXTURES_HPP_
#define FRAMEWATCH_TESTS_COMMON_JSON_FIXTURES_HPP_

#include "assertions.hpp"
#include "core/json_dom.hpp"

#include <string>
#include <string_view>

namespace framewatch::tests::common {

inline core::json::Value ParseJsonOrFail(std::string_view text) {
  core::json::Value value;
  std::string error;
  if (!core::json::Parse(text, value, error)) {
    Fail("test fixture JSON did not parse: " + error);
  }
  return value;
}

} // namespace framewatch::tests::common

#endif // FRAMEWATCH_TESTS_COMMON_JSON_FIXTURES_HPP_
