#include <tripack/data/Lower_shape.hpp>

//
// ... tripack header files
//
#include <tripack/data/lower_indexing.hpp>
#include <tripack/data/shape_support.hpp>
#include <tripack/data/triangular_number.hpp>

namespace tripack::data::detail {

  Lower_shape::Lower_shape(size_type n)
    : n_(n)
  {
    check_axis_length("Lower_shape", n_, 0);
  }

  config::size_type
  Lower_shape::n() const { return n_; }

  config::size_type
  Lower_shape::size() const { return tri_num(n_); }

  bool
  Lower_shape::contains(size_type i, size_type j) const
  {
    return 0 <= j && j <= i && i < n_;
  }

  config::size_type
  Lower_shape::element_index(size_type i, size_type j) const
  {
    check_coordinate(contains(i, j), "Lower_shape::element_index", i, j);
    return lower_indexing::element_index(i, j);
  }

  config::size_type
  Lower_shape::row_start_index(size_type i) const
  {
    check_axis_index(0 <= i && i < n_, "Lower_shape::row_start_index", i);
    return lower_indexing::row_start(i);
  }

  config::size_type
  Lower_shape::col_start_index(size_type j) const
  {
    check_axis_index(0 <= j && j < n_, "Lower_shape::col_start_index", j);
    return lower_indexing::col_start(j);
  }

  Offset_sequence
  Lower_shape::row_indices(size_type i) const
  {
    check_axis_index(0 <= i && i < n_, "Lower_shape::row_indices", i);
    return lower_indexing::row_indices(i);
  }

  Offset_sequence
  Lower_shape::col_indices(size_type j) const
  {
    check_axis_index(0 <= j && j < n_, "Lower_shape::col_indices", j);
    return lower_indexing::col_indices(j, n_);
  }

  std::vector<Index>
  Lower_shape::triangle_indices() const
  {
    std::vector<Index> result;
    result.reserve(static_cast<std::size_t>(size()));
    for (size_type i = 0; i < n_; ++i) {
      for (size_type j = 0; j <= i; ++j) {
        result.push_back(Index{i, j});
      }
    }
    return result;
  }

  bool
  operator==(Lower_shape const& shape1, Lower_shape const& shape2)
  {
    return shape1.n_ == shape2.n_;
  }

  void
  to_json(json& j, Lower_shape const& shape)
  {
    shape_to_json(j, Lower_shape::kind, shape.n());
  }

  void
  from_json(json const& j, Lower_shape& shape)
  {
    shape = Lower_shape(shape_from_json(j, Lower_shape::kind));
  }

} // end of namespace tripack::data::detail
