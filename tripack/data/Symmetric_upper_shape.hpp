#pragma once

//
// ... Standard header files
//
#include <vector>

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/Index.hpp>
#include <tripack/data/Offset_sequence.hpp>
#include <tripack/data/Simple_upper_shape.hpp>
#include <tripack/data/import.hpp>

namespace tripack::data::detail {

  /**
   * @brief A symmetric matrix without diagonal, stored as its strict
   * upper triangle.
   *
   * The storage is that of Simple_upper_shape and element (i, j) is the
   * stored element (min(i,j), max(i,j)). With n = 5:
   *
   * @code
   *   row 0:     0  1  2  3
   *   row 1:  0     4  5  6
   *   row 2:  1  4     7  8
   *   row 3:  2  5  7     9
   *   row 4:  3  6  8  9
   * @endcode
   */
  class Symmetric_upper_shape final {
  public:
    using size_type = config::size_type;

    static constexpr char const* kind = "symmetric_upper";

    Symmetric_upper_shape() = default;

    explicit Symmetric_upper_shape(size_type n);

    size_type
    n() const;

    size_type
    size() const;

    bool
    contains(size_type i, size_type j) const;

    size_type
    element_index(size_type i, size_type j) const;

    size_type
    row_start_index(size_type i) const;

    size_type
    col_start_index(size_type j) const;

    /**
     * @brief Offsets of the n-1 elements (i, x), x != i, by ascending x:
     * the stored column i (x < i) followed by the stored row i (x > i).
     */
    Offset_sequence
    row_indices(size_type i) const;

    Offset_sequence
    col_indices(size_type j) const;

    /**
     * @brief Every stored slot once, as its upper coordinate (i < j).
     */
    std::vector<Index>
    triangle_indices() const;

    friend bool
    operator==(Symmetric_upper_shape const& shape1,
               Symmetric_upper_shape const& shape2);

  private:
    Simple_upper_shape storage_shape_;

  }; // end of class Symmetric_upper_shape

  void
  to_json(json& j, Symmetric_upper_shape const& shape);

  void
  from_json(json const& j, Symmetric_upper_shape& shape);

} // end of namespace tripack::data::detail
