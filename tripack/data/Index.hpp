#pragma once

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/import.hpp>

namespace tripack::data::detail {

  /**
   * @brief A logical matrix coordinate: a row and a column.
   *
   * Whether a coordinate is valid depends on the triangle shape it is
   * used with; Index itself only rejects negative components.
   */
  class Index final {
  public:
    using size_type = config::size_type;

    Index(size_type row, size_type column);

    size_type
    row() const;

    size_type
    column() const;

    /**
     * @brief The coordinate with row and column exchanged.
     */
    Index
    transposed() const;

    bool
    is_diagonal() const;

    /**
     * @brief The orientation of this coordinate with row >= column.
     */
    Index
    lower() const;

    /**
     * @brief The orientation of this coordinate with row <= column.
     */
    Index
    upper() const;

    friend bool
    operator==(const Index& index1, const Index& index2);

  private:
    size_type row_{};
    size_type column_{};

  }; // end of class Index

} // namespace tripack::data::detail
