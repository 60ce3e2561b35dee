#pragma once

//
// ... Standard header files
//
#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

namespace tripack::data::detail {

  using size_type = std::ptrdiff_t;

  using nlohmann::json;

  using std::vector;

  using std::domain_error;
  using std::invalid_argument;
  using std::logic_error;
  using std::out_of_range;
  using std::overflow_error;

} // end of namespace tripack::data::detail
