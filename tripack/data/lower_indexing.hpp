#pragma once

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/Offset_sequence.hpp>

/**
 * @brief Offsets into a row-major packed lower triangle that includes
 * the diagonal.
 *
 * Row @c i occupies @f$ [T(i), T(i+1)) @f$ and holds @c i+1 elements:
 *
 * @code
 *   0
 *   1 2
 *   3 4 5
 *   6 7 8 9
 * @endcode
 *
 * These functions do not validate their arguments; the shape classes
 * do that before calling them.
 */
namespace tripack::data::detail::lower_indexing {

  using size_type = config::size_type;

  /**
   * @brief Offset of element (i, j), @f$ 0 \le j \le i @f$.
   */
  size_type
  element_index(size_type i, size_type j);

  size_type
  row_start(size_type i);

  /**
   * @brief Offset of the first element of column @p j, which is the
   * diagonal element (j, j).
   */
  size_type
  col_start(size_type j);

  Offset_sequence
  row_indices(size_type i);

  /**
   * @brief Offsets of column @p j in a triangle of axis length @p n:
   * rows j through n-1, @c n-j offsets.
   */
  Offset_sequence
  col_indices(size_type j, size_type n);

} // end of namespace tripack::data::detail::lower_indexing
