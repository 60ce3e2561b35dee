#include <tripack/data/triangular_number.hpp>

//
// ... Standard header files
//
#include <cmath>
#include <limits>
#include <string>

namespace tripack::data::detail {

  config::size_type
  max_tri_num_arg()
  {
    using limits = std::numeric_limits<config::size_type>;

    // Largest n with n(n+1) <= max. The square root is within a step or
    // two of the answer, so correct it in both directions.
    auto n = static_cast<config::size_type>(
      std::sqrt(static_cast<long double>(limits::max())));
    while (n > limits::max() / (n + 1)) {
      --n;
    }
    while (n + 1 <= limits::max() / (n + 2)) {
      ++n;
    }
    return n;
  }

  config::size_type
  tri_num(config::size_type n)
  {
    if (n < 0) {
      throw domain_error("tri_num: negative argument " + std::to_string(n));
    }
    if constexpr (config::check_overflow) {
      if (n == std::numeric_limits<config::size_type>::max()
          || n > std::numeric_limits<config::size_type>::max() / (n + 1)) {
        throw overflow_error(
          "tri_num: range exceeded for argument " + std::to_string(n));
      }
    }
    return (n * (n + 1)) / 2;
  }

} // end of namespace tripack::data::detail
