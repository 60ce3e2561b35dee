#include <tripack/data/Symmetric_lower_shape.hpp>

//
// ... tripack header files
//
#include <tripack/data/shape_support.hpp>

namespace tripack::data::detail {

  Symmetric_lower_shape::Symmetric_lower_shape(size_type n)
    : storage_shape_(n)
  {}

  config::size_type
  Symmetric_lower_shape::n() const { return storage_shape_.n(); }

  config::size_type
  Symmetric_lower_shape::size() const { return storage_shape_.size(); }

  bool
  Symmetric_lower_shape::contains(size_type i, size_type j) const
  {
    return i < j ? storage_shape_.contains(j, i) : storage_shape_.contains(i, j);
  }

  config::size_type
  Symmetric_lower_shape::element_index(size_type i, size_type j) const
  {
    check_coordinate(
      contains(i, j), "Symmetric_lower_shape::element_index", i, j);
    auto slot = Index{i, j}.lower();
    return storage_shape_.element_index(slot.row(), slot.column());
  }

  config::size_type
  Symmetric_lower_shape::row_start_index(size_type i) const
  {
    auto indices = row_indices(i);
    check_axis_index(
      !indices.empty(), "Symmetric_lower_shape::row_start_index", i);
    return indices[0];
  }

  config::size_type
  Symmetric_lower_shape::col_start_index(size_type j) const
  {
    return row_start_index(j);
  }

  Offset_sequence
  Symmetric_lower_shape::row_indices(size_type i) const
  {
    check_axis_index(
      0 <= i && i < n(), "Symmetric_lower_shape::row_indices", i);

    Offset_sequence before;
    if (i > 0) {
      before = storage_shape_.row_indices(i);
    }
    return before.then(storage_shape_.col_indices(i));
  }

  Offset_sequence
  Symmetric_lower_shape::col_indices(size_type j) const
  {
    return row_indices(j);
  }

  std::vector<Index>
  Symmetric_lower_shape::triangle_indices() const
  {
    return storage_shape_.triangle_indices();
  }

  bool
  operator==(Symmetric_lower_shape const& shape1,
             Symmetric_lower_shape const& shape2)
  {
    return shape1.storage_shape_ == shape2.storage_shape_;
  }

  void
  to_json(json& j, Symmetric_lower_shape const& shape)
  {
    shape_to_json(j, Symmetric_lower_shape::kind, shape.n());
  }

  void
  from_json(json const& j, Symmetric_lower_shape& shape)
  {
    shape = Symmetric_lower_shape(
      shape_from_json(j, Symmetric_lower_shape::kind));
  }

} // end of namespace tripack::data::detail
