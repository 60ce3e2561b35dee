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
#include <tripack/data/import.hpp>

namespace tripack::data::detail {

  /**
   * @brief A lower triangle including the diagonal, packed row by row.
   *
   * Valid coordinates satisfy @f$ 0 \le j \le i < n @f$ and the packed
   * size is T(n). With n = 4:
   *
   * @code
   *   (0,0)                     0
   *   (1,0) (1,1)               1 2
   *   (2,0) (2,1) (2,2)         3 4 5
   *   (3,0) (3,1) (3,2) (3,3)   6 7 8 9
   * @endcode
   *
   * Every member that takes a coordinate throws std::out_of_range when
   * the coordinate lies outside the triangle.
   */
  class Lower_shape final {
  public:
    using size_type = config::size_type;

    static constexpr char const* kind = "lower";

    Lower_shape() = default;

    /**
     * @throws std::invalid_argument if @p n is negative.
     */
    explicit Lower_shape(size_type n);

    size_type
    n() const;

    /**
     * @brief Return the packed length, T(n).
     */
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

    Offset_sequence
    row_indices(size_type i) const;

    Offset_sequence
    col_indices(size_type j) const;

    /**
     * @brief Every valid coordinate, in packed order.
     */
    std::vector<Index>
    triangle_indices() const;

    friend bool
    operator==(Lower_shape const& shape1, Lower_shape const& shape2);

  private:
    size_type n_{};

  }; // end of class Lower_shape

  void
  to_json(json& j, Lower_shape const& shape);

  void
  from_json(json const& j, Lower_shape& shape);

} // end of namespace tripack::data::detail
