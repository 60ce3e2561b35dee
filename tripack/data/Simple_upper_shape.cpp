#include <tripack/data/Simple_upper_shape.hpp>

//
// ... tripack header files
//
#include <tripack/data/shape_support.hpp>
#include <tripack/data/triangular_number.hpp>
#include <tripack/data/upper_indexing.hpp>

namespace tripack::data::detail {

  Simple_upper_shape::Simple_upper_shape(size_type n)
    : n_(n)
  {
    check_axis_length("Simple_upper_shape", n_, 1);
  }

  config::size_type
  Simple_upper_shape::n() const { return n_; }

  config::size_type
  Simple_upper_shape::size() const { return tri_num(n_ - 1); }

  bool
  Simple_upper_shape::contains(size_type i, size_type j) const
  {
    return 0 <= i && i < j && j < n_;
  }

  config::size_type
  Simple_upper_shape::element_index(size_type i, size_type j) const
  {
    check_coordinate(
      contains(i, j), "Simple_upper_shape::element_index", i, j);
    return upper_indexing::element_index(i, j - (i + 1), n_ - 1);
  }

  config::size_type
  Simple_upper_shape::row_start_index(size_type i) const
  {
    check_axis_index(
      0 <= i && i < n_ - 1, "Simple_upper_shape::row_start_index", i);
    return upper_indexing::row_start(i, n_ - 1);
  }

  config::size_type
  Simple_upper_shape::col_start_index(size_type j) const
  {
    check_axis_index(
      1 <= j && j < n_, "Simple_upper_shape::col_start_index", j);
    return upper_indexing::col_start(j - 1);
  }

  Offset_sequence
  Simple_upper_shape::row_indices(size_type i) const
  {
    check_axis_index(0 <= i && i < n_, "Simple_upper_shape::row_indices", i);
    return upper_indexing::row_indices(i, n_ - 1);
  }

  Offset_sequence
  Simple_upper_shape::col_indices(size_type j) const
  {
    check_axis_index(1 <= j && j < n_, "Simple_upper_shape::col_indices", j);
    return upper_indexing::col_indices(j - 1, n_ - 1);
  }

  std::vector<Index>
  Simple_upper_shape::triangle_indices() const
  {
    std::vector<Index> result;
    result.reserve(static_cast<std::size_t>(size()));
    for (size_type row = 0; row < n_ - 1; ++row) {
      for (size_type col = row; col < n_ - 1; ++col) {
        result.push_back(Index{row, col + 1});
      }
    }
    return result;
  }

  bool
  operator==(Simple_upper_shape const& shape1,
             Simple_upper_shape const& shape2)
  {
    return shape1.n_ == shape2.n_;
  }

  void
  to_json(json& j, Simple_upper_shape const& shape)
  {
    shape_to_json(j, Simple_upper_shape::kind, shape.n());
  }

  void
  from_json(json const& j, Simple_upper_shape& shape)
  {
    shape = Simple_upper_shape(shape_from_json(j, Simple_upper_shape::kind));
  }

} // end of namespace tripack::data::detail
