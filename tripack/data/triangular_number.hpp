#pragma once

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/import.hpp>

namespace tripack::data::detail {

  /**
   * @brief The n-th triangular number, @f$ T(n) = n(n+1)/2 @f$.
   *
   * T(n) is the number of elements in a triangle of side n including the
   * diagonal, and T(n - 1) the number without it.
   *
   * @throws std::domain_error    if @p n is negative.
   * @throws std::overflow_error  if config::check_overflow is set and
   *                              n(n+1) does not fit in size_type.
   */
  config::size_type
  tri_num(config::size_type n);

  /**
   * @brief The largest argument tri_num accepts without overflow.
   */
  config::size_type
  max_tri_num_arg();

} // end of namespace tripack::data::detail
