#include <tripack/data/lower_indexing.hpp>

//
// ... tripack header files
//
#include <tripack/data/triangular_number.hpp>

namespace tripack::data::detail::lower_indexing {

  size_type
  element_index(size_type i, size_type j)
  {
    return tri_num(i) + j;
  }

  size_type
  row_start(size_type i)
  {
    return tri_num(i);
  }

  size_type
  col_start(size_type j)
  {
    return tri_num(j) + j;
  }

  Offset_sequence
  row_indices(size_type i)
  {
    return Offset_sequence::contiguous(row_start(i), i + 1);
  }

  Offset_sequence
  col_indices(size_type j, size_type n)
  {
    return Offset_sequence::lower_column(j, j, n - j);
  }

} // end of namespace tripack::data::detail::lower_indexing
