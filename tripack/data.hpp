#pragma once

//
// ... tripack header files
//
#include <tripack/data/Index.hpp>
#include <tripack/data/Lower_shape.hpp>
#include <tripack/data/Offset_sequence.hpp>
#include <tripack/data/Packed_storage.hpp>
#include <tripack/data/Packed_triangle.hpp>
#include <tripack/data/Simple_lower_shape.hpp>
#include <tripack/data/Simple_upper_shape.hpp>
#include <tripack/data/Symmetric_lower_shape.hpp>
#include <tripack/data/Symmetric_upper_shape.hpp>
#include <tripack/data/Triangle_storage.hpp>
#include <tripack/data/Upper_shape.hpp>
#include <tripack/data/triangular_number.hpp>

namespace tripack::data {
  using ::tripack::data::detail::Index;
  using ::tripack::data::detail::Offset_sequence;

  using ::tripack::data::detail::Lower_shape;
  using ::tripack::data::detail::Upper_shape;
  using ::tripack::data::detail::Simple_lower_shape;
  using ::tripack::data::detail::Simple_upper_shape;
  using ::tripack::data::detail::Symmetric_lower_shape;
  using ::tripack::data::detail::Symmetric_upper_shape;

  using ::tripack::data::detail::Triangle_storage;
  using ::tripack::data::detail::Mutable_triangle_storage;
  using ::tripack::data::detail::Packed_storage;

  using ::tripack::data::detail::Packed_triangle;
  using ::tripack::data::detail::Packed_triangle_mut;

  using ::tripack::data::detail::Lower_tri;
  using ::tripack::data::detail::Lower_tri_mut;
  using ::tripack::data::detail::Upper_tri;
  using ::tripack::data::detail::Upper_tri_mut;
  using ::tripack::data::detail::Simple_lower_tri;
  using ::tripack::data::detail::Simple_lower_tri_mut;
  using ::tripack::data::detail::Simple_upper_tri;
  using ::tripack::data::detail::Simple_upper_tri_mut;
  using ::tripack::data::detail::Symmetric_lower_tri;
  using ::tripack::data::detail::Symmetric_lower_tri_mut;
  using ::tripack::data::detail::Symmetric_upper_tri;
  using ::tripack::data::detail::Symmetric_upper_tri_mut;

  using ::tripack::data::detail::tri_num;
  using ::tripack::data::detail::max_tri_num_arg;

} // end of namespace tripack::data
