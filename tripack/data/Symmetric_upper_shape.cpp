#include <tripack/data/Symmetric_upper_shape.hpp>

//
// ... Standard header files
//
#include <algorithm>

//
// ... tripack header files
//
#include <tripack/data/shape_support.hpp>

namespace tripack::data::detail {

  Symmetric_upper_shape::Symmetric_upper_shape(size_type n)
    : storage_shape_(n)
  {}

  config::size_type
  Symmetric_upper_shape::n() const { return storage_shape_.n(); }

  config::size_type
  Symmetric_upper_shape::size() const { return storage_shape_.size(); }

  bool
  Symmetric_upper_shape::contains(size_type i, size_type j) const
  {
    return storage_shape_.contains(std::min(i, j), std::max(i, j));
  }

  config::size_type
  Symmetric_upper_shape::element_index(size_type i, size_type j) const
  {
    check_coordinate(
      contains(i, j), "Symmetric_upper_shape::element_index", i, j);
    auto slot = Index{i, j}.upper();
    return storage_shape_.element_index(slot.row(), slot.column());
  }

  config::size_type
  Symmetric_upper_shape::row_start_index(size_type i) const
  {
    auto indices = row_indices(i);
    check_axis_index(
      !indices.empty(), "Symmetric_upper_shape::row_start_index", i);
    return indices[0];
  }

  config::size_type
  Symmetric_upper_shape::col_start_index(size_type j) const
  {
    return row_start_index(j);
  }

  Offset_sequence
  Symmetric_upper_shape::row_indices(size_type i) const
  {
    check_axis_index(
      0 <= i && i < n(), "Symmetric_upper_shape::row_indices", i);

    Offset_sequence before;
    if (i > 0) {
      before = storage_shape_.col_indices(i);
    }
    return before.then(storage_shape_.row_indices(i));
  }

  Offset_sequence
  Symmetric_upper_shape::col_indices(size_type j) const
  {
    return row_indices(j);
  }

  std::vector<Index>
  Symmetric_upper_shape::triangle_indices() const
  {
    return storage_shape_.triangle_indices();
  }

  bool
  operator==(Symmetric_upper_shape const& shape1,
             Symmetric_upper_shape const& shape2)
  {
    return shape1.storage_shape_ == shape2.storage_shape_;
  }

  void
  to_json(json& j, Symmetric_upper_shape const& shape)
  {
    shape_to_json(j, Symmetric_upper_shape::kind, shape.n());
  }

  void
  from_json(json const& j, Symmetric_upper_shape& shape)
  {
    shape = Symmetric_upper_shape(
      shape_from_json(j, Symmetric_upper_shape::kind));
  }

} // end of namespace tripack::data::detail
