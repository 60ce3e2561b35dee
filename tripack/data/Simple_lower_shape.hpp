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
   * @brief A lower triangle without the diagonal, packed row by row.
   *
   * An n by n matrix has valid coordinates @f$ 0 \le j < i < n @f$. The
   * packing is the diagonal-inclusive lower layout of axis length n-1
   * with logical row i stored as packed row i-1, so the packed size is
   * T(n-1). With n = 5:
   *
   * @code
   *   row 1:  0
   *   row 2:  1 2
   *   row 3:  3 4 5
   *   row 4:  6 7 8 9
   * @endcode
   *
   * Row 0 holds no element and is rejected by every row operation.
   * Column n-1 holds no element either: col_indices(n-1) is empty and
   * col_start_index(n-1) is rejected.
   *
   * @throws std::out_of_range from every member given a coordinate
   * outside the triangle, the diagonal included.
   */
  class Simple_lower_shape final {
  public:
    using size_type = config::size_type;

    static constexpr char const* kind = "simple_lower";

    /**
     * @brief The 1 by 1 triangle, which holds no element.
     */
    Simple_lower_shape() = default;

    /**
     * @throws std::invalid_argument if @p n is less than 1.
     */
    explicit Simple_lower_shape(size_type n);

    size_type
    n() const;

    /**
     * @brief Return the packed length, T(n-1).
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

    /**
     * @brief Offsets of row @p i, @f$ 1 \le i < n @f$: i contiguous offsets.
     */
    Offset_sequence
    row_indices(size_type i) const;

    /**
     * @brief Offsets of column @p j, @f$ 0 \le j < n @f$: rows j+1
     * through n-1.
     */
    Offset_sequence
    col_indices(size_type j) const;

    /**
     * @brief Every valid coordinate in packed order: (1,0), (2,0), (2,1),
     * (3,0), ...
     */
    std::vector<Index>
    triangle_indices() const;

    friend bool
    operator==(Simple_lower_shape const& shape1,
               Simple_lower_shape const& shape2);

  private:
    size_type n_{1};

  }; // end of class Simple_lower_shape

  void
  to_json(json& j, Simple_lower_shape const& shape);

  void
  from_json(json const& j, Simple_lower_shape& shape);

} // end of namespace tripack::data::detail
