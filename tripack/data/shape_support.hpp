#pragma once

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/import.hpp>

namespace tripack::data::detail {

  /**
   * @brief Reject an axis length below @p minimum, or one whose packed
   * size cannot be represented.
   *
   * @throws std::invalid_argument  if @p n is less than @p minimum.
   * @throws std::overflow_error    if T(n) overflows (see tri_num).
   */
  void
  check_axis_length(char const* shape, size_type n, size_type minimum);

  /**
   * @throws std::out_of_range naming @p operation and the coordinate
   * (i, j) unless @p valid.
   */
  void
  check_coordinate(bool valid, char const* operation, size_type i, size_type j);

  /**
   * @throws std::out_of_range naming @p operation and the row or column
   * @p index unless @p valid.
   */
  void
  check_axis_index(bool valid, char const* operation, size_type index);

  void
  shape_to_json(json& j, char const* kind, size_type n);

  /**
   * @brief The axis length stored in a shape's JSON form.
   *
   * @throws std::invalid_argument if the "kind" member is not @p kind.
   */
  size_type
  shape_from_json(json const& j, char const* kind);

} // end of namespace tripack::data::detail
