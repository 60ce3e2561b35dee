#include <tripack/data/Upper_shape.hpp>

//
// ... tripack header files
//
#include <tripack/data/shape_support.hpp>
#include <tripack/data/triangular_number.hpp>
#include <tripack/data/upper_indexing.hpp>

namespace tripack::data::detail {

  Upper_shape::Upper_shape(size_type n)
    : n_(n)
  {
    check_axis_length("Upper_shape", n_, 0);
  }

  config::size_type
  Upper_shape::n() const { return n_; }

  config::size_type
  Upper_shape::size() const { return tri_num(n_); }

  bool
  Upper_shape::contains(size_type i, size_type j) const
  {
    return 0 <= i && i <= j && j < n_;
  }

  config::size_type
  Upper_shape::element_index(size_type i, size_type j) const
  {
    check_coordinate(contains(i, j), "Upper_shape::element_index", i, j);
    return upper_indexing::element_index(i, j - i, n_);
  }

  config::size_type
  Upper_shape::row_start_index(size_type i) const
  {
    check_axis_index(0 <= i && i < n_, "Upper_shape::row_start_index", i);
    return upper_indexing::row_start(i, n_);
  }

  config::size_type
  Upper_shape::col_start_index(size_type j) const
  {
    check_axis_index(0 <= j && j < n_, "Upper_shape::col_start_index", j);
    return upper_indexing::col_start(j);
  }

  Offset_sequence
  Upper_shape::row_indices(size_type i) const
  {
    check_axis_index(0 <= i && i < n_, "Upper_shape::row_indices", i);
    return upper_indexing::row_indices(i, n_);
  }

  Offset_sequence
  Upper_shape::col_indices(size_type j) const
  {
    check_axis_index(0 <= j && j < n_, "Upper_shape::col_indices", j);
    return upper_indexing::col_indices(j, n_);
  }

  std::vector<Index>
  Upper_shape::triangle_indices() const
  {
    std::vector<Index> result;
    result.reserve(static_cast<std::size_t>(size()));
    for (size_type i = 0; i < n_; ++i) {
      for (size_type j = i; j < n_; ++j) {
        result.push_back(Index{i, j});
      }
    }
    return result;
  }

  bool
  operator==(Upper_shape const& shape1, Upper_shape const& shape2)
  {
    return shape1.n_ == shape2.n_;
  }

  void
  to_json(json& j, Upper_shape const& shape)
  {
    shape_to_json(j, Upper_shape::kind, shape.n());
  }

  void
  from_json(json const& j, Upper_shape& shape)
  {
    shape = Upper_shape(shape_from_json(j, Upper_shape::kind));
  }

} // end of namespace tripack::data::detail
