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
   * @brief An upper triangle without the diagonal, packed row by row.
   *
   * Valid coordinates satisfy @f$ 0 \le i < j < n @f$. The packing is
   * the diagonal-inclusive upper layout of axis length n-1 with logical
   * column j stored as packed column j-1; the packed size is T(n-1).
   * With n = 5:
   *
   * @code
   *            col 1  2  3  4
   *   row 0:       0  1  2  3
   *   row 1:          4  5  6
   *   row 2:             7  8
   *   row 3:                9
   * @endcode
   *
   * Column 0 holds no element and is rejected by every column
   * operation. Row n-1 is empty: row_indices(n-1) yields nothing and
   * row_start_index(n-1) is rejected.
   */
  class Simple_upper_shape final {
  public:
    using size_type = config::size_type;

    static constexpr char const* kind = "simple_upper";

    Simple_upper_shape() = default;

    /**
     * @throws std::invalid_argument if @p n is less than 1.
     */
    explicit Simple_upper_shape(size_type n);

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

    Offset_sequence
    row_indices(size_type i) const;

    Offset_sequence
    col_indices(size_type j) const;

    std::vector<Index>
    triangle_indices() const;

    friend bool
    operator==(Simple_upper_shape const& shape1,
               Simple_upper_shape const& shape2);

  private:
    size_type n_{1};

  }; // end of class Simple_upper_shape

  void
  to_json(json& j, Simple_upper_shape const& shape);

  void
  from_json(json const& j, Simple_upper_shape& shape);

} // end of namespace tripack::data::detail
