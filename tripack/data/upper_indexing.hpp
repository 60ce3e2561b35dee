#pragma once

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/Offset_sequence.hpp>

/**
 * @brief Offsets into a row-major packed upper triangle that includes
 * the diagonal.
 *
 * With axis length @c n, row @c i holds @c n-i elements starting at
 * @f$ T(n) - T(n-i) @f$:
 *
 * @code
 *   0 1 2 3
 *     4 5 6
 *       7 8
 *         9
 * @endcode
 *
 * These functions do not validate their arguments; the shape classes
 * do that before calling them.
 */
namespace tripack::data::detail::upper_indexing {

  using size_type = config::size_type;

  /**
   * @brief Offset of the element @p k positions into row @p i.
   *
   * @p k is relative to the first element of the row, so the element
   * (i, j) of a diagonal-inclusive triangle has @c k = j-i.
   */
  size_type
  element_index(size_type i, size_type k, size_type n);

  size_type
  row_start(size_type i, size_type n);

  size_type
  col_start(size_type j);

  /**
   * @brief Offsets of row @p i: @c n-i contiguous offsets, none for
   * @c i == n.
   */
  Offset_sequence
  row_indices(size_type i, size_type n);

  /**
   * @brief Offsets of column @p j: rows 0 through j, @c j+1 offsets.
   */
  Offset_sequence
  col_indices(size_type j, size_type n);

} // end of namespace tripack::data::detail::upper_indexing
