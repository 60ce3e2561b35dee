#pragma once

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data.hpp>
#include <tripack/data/json_serialization.hpp>

namespace tripack {
  using namespace ::tripack::data;

} // end of namespace tripack
