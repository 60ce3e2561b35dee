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
#include <tripack/data/Simple_lower_shape.hpp>
#include <tripack/data/import.hpp>

namespace tripack::data::detail {

  /**
   * @brief A symmetric matrix without diagonal, stored as its strict
   * lower triangle.
   *
   * The storage is that of Simple_lower_shape. Every off-diagonal
   * coordinate is valid and (i, j) and (j, i) address the same slot.
   * Rows and columns coincide; with n = 5:
   *
   * @code
   *   row 0:     0  1  3  6
   *   row 1:  0     2  4  7
   *   row 2:  1  2     5  8
   *   row 3:  3  4  5     9
   *   row 4:  6  7  8  9
   * @endcode
   */
  class Symmetric_lower_shape final {
  public:
    using size_type = config::size_type;

    static constexpr char const* kind = "symmetric_lower";

    Symmetric_lower_shape() = default;

    explicit Symmetric_lower_shape(size_type n);

    size_type
    n() const;

    size_type
    size() const;

    /**
     * @brief Whether (i, j) is an off-diagonal coordinate of the matrix.
     */
    bool
    contains(size_type i, size_type j) const;

    size_type
    element_index(size_type i, size_type j) const;

    /**
     * @brief The first offset of row_indices(i).
     */
    size_type
    row_start_index(size_type i) const;

    size_type
    col_start_index(size_type j) const;

    /**
     * @brief Offsets of the n-1 elements (i, x), x != i, by ascending x.
     *
     * The stored row i supplies x < i and the stored column i supplies
     * x > i.
     */
    Offset_sequence
    row_indices(size_type i) const;

    /**
     * @brief Same as row_indices(j).
     */
    Offset_sequence
    col_indices(size_type j) const;

    /**
     * @brief Every stored slot once, as its lower coordinate (i > j).
     */
    std::vector<Index>
    triangle_indices() const;

    friend bool
    operator==(Symmetric_lower_shape const& shape1,
               Symmetric_lower_shape const& shape2);

  private:
    Simple_lower_shape storage_shape_;

  }; // end of class Symmetric_lower_shape

  void
  to_json(json& j, Symmetric_lower_shape const& shape);

  void
  from_json(json const& j, Symmetric_lower_shape& shape);

} // end of namespace tripack::data::detail
