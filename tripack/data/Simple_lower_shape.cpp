#include <tripack/data/Simple_lower_shape.hpp>

//
// ... tripack header files
//
#include <tripack/data/lower_indexing.hpp>
#include <tripack/data/shape_support.hpp>
#include <tripack/data/triangular_number.hpp>

namespace tripack::data::detail {

  Simple_lower_shape::Simple_lower_shape(size_type n)
    : n_(n)
  {
    check_axis_length("Simple_lower_shape", n_, 1);
  }

  config::size_type
  Simple_lower_shape::n() const { return n_; }

  config::size_type
  Simple_lower_shape::size() const { return tri_num(n_ - 1); }

  bool
  Simple_lower_shape::contains(size_type i, size_type j) const
  {
    return 0 <= j && j < i && i < n_;
  }

  config::size_type
  Simple_lower_shape::element_index(size_type i, size_type j) const
  {
    check_coordinate(
      contains(i, j), "Simple_lower_shape::element_index", i, j);
    return lower_indexing::element_index(i - 1, j);
  }

  config::size_type
  Simple_lower_shape::row_start_index(size_type i) const
  {
    check_axis_index(
      1 <= i && i < n_, "Simple_lower_shape::row_start_index", i);
    return lower_indexing::row_start(i - 1);
  }

  config::size_type
  Simple_lower_shape::col_start_index(size_type j) const
  {
    check_axis_index(
      0 <= j && j < n_ - 1, "Simple_lower_shape::col_start_index", j);
    return lower_indexing::col_start(j);
  }

  Offset_sequence
  Simple_lower_shape::row_indices(size_type i) const
  {
    check_axis_index(1 <= i && i < n_, "Simple_lower_shape::row_indices", i);
    return lower_indexing::row_indices(i - 1);
  }

  Offset_sequence
  Simple_lower_shape::col_indices(size_type j) const
  {
    check_axis_index(0 <= j && j < n_, "Simple_lower_shape::col_indices", j);
    return lower_indexing::col_indices(j, n_ - 1);
  }

  std::vector<Index>
  Simple_lower_shape::triangle_indices() const
  {
    std::vector<Index> result;
    result.reserve(static_cast<std::size_t>(size()));
    for (size_type row = 0; row < n_ - 1; ++row) {
      for (size_type col = 0; col <= row; ++col) {
        result.push_back(Index{row + 1, col});
      }
    }
    return result;
  }

  bool
  operator==(Simple_lower_shape const& shape1,
             Simple_lower_shape const& shape2)
  {
    return shape1.n_ == shape2.n_;
  }

  void
  to_json(json& j, Simple_lower_shape const& shape)
  {
    shape_to_json(j, Simple_lower_shape::kind, shape.n());
  }

  void
  from_json(json const& j, Simple_lower_shape& shape)
  {
    shape = Simple_lower_shape(shape_from_json(j, Simple_lower_shape::kind));
  }

} // end of namespace tripack::data::detail
