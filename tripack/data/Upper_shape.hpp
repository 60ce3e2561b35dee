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
   * @brief An upper triangle including the diagonal, packed row by row.
   *
   * Valid coordinates satisfy @f$ 0 \le i \le j < n @f$ and the packed
   * size is T(n). With n = 4 the rows hold 4, 3, 2 and 1 elements:
   *
   * @code
   *   0 1 2 3
   *     4 5 6
   *       7 8
   *         9
   * @endcode
   *
   * Coordinates are absolute: element (1, 2) is offset 5.
   */
  class Upper_shape final {
  public:
    using size_type = config::size_type;

    static constexpr char const* kind = "upper";

    Upper_shape() = default;

    explicit Upper_shape(size_type n);

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
    operator==(Upper_shape const& shape1, Upper_shape const& shape2);

  private:
    size_type n_{};

  }; // end of class Upper_shape

  void
  to_json(json& j, Upper_shape const& shape);

  void
  from_json(json const& j, Upper_shape& shape);

} // end of namespace tripack::data::detail
