#include <tripack/data/upper_indexing.hpp>

//
// ... tripack header files
//
#include <tripack/data/triangular_number.hpp>

namespace tripack::data::detail::upper_indexing {

  size_type
  element_index(size_type i, size_type k, size_type n)
  {
    return row_start(i, n) + k;
  }

  size_type
  row_start(size_type i, size_type n)
  {
    return tri_num(n) - tri_num(n - i);
  }

  size_type
  col_start(size_type j)
  {
    return j;
  }

  Offset_sequence
  row_indices(size_type i, size_type n)
  {
    return Offset_sequence::contiguous(row_start(i, n), n - i);
  }

  Offset_sequence
  col_indices(size_type j, size_type n)
  {
    return Offset_sequence::upper_column(j, n);
  }

} // end of namespace tripack::data::detail::upper_indexing
