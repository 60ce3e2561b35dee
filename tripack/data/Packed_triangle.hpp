#pragma once

//
// ... Standard header files
//
#include <string>
#include <utility>
#include <vector>

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/Index.hpp>
#include <tripack/data/Lower_shape.hpp>
#include <tripack/data/Offset_sequence.hpp>
#include <tripack/data/Simple_lower_shape.hpp>
#include <tripack/data/Simple_upper_shape.hpp>
#include <tripack/data/Symmetric_lower_shape.hpp>
#include <tripack/data/Symmetric_upper_shape.hpp>
#include <tripack/data/Triangle_storage.hpp>
#include <tripack/data/Upper_shape.hpp>
#include <tripack/data/import.hpp>

namespace tripack::data::detail {

  /**
   * @brief Read-only element access to packed storage through a
   * triangle shape.
   *
   * The view refers to the storage; the storage must outlive it, so
   * binding a temporary is rejected. The shape is built from the
   * storage's axis length and must account for exactly the stored
   * elements.
   *
   * @tparam Shape  One of the shape classes (Lower_shape,
   *                Simple_lower_shape, Symmetric_upper_shape, ...).
   * @tparam T      Element type.
   */
  template<typename Shape, typename T = config::value_type>
  class Packed_triangle
  {
  public:
    using size_type = config::size_type;
    using shape_type = Shape;
    using value_type = T;

    /**
     * @throws std::invalid_argument if the storage length differs from
     * the packed size of the shape.
     */
    explicit Packed_triangle(Triangle_storage<T> const& storage)
      : shape_(storage.n())
      , storage_(storage)
    {
      if (storage_.size() != shape_.size()) {
        throw invalid_argument(
          std::string(Shape::kind) + " triangle of axis length "
          + std::to_string(shape_.n()) + " needs "
          + std::to_string(shape_.size()) + " elements, storage holds "
          + std::to_string(storage_.size()));
      }
    }

    Packed_triangle(Triangle_storage<T> const&&) = delete;

    Shape const&
    shape() const
    {
      return shape_;
    }

    size_type
    n() const
    {
      return shape_.n();
    }

    size_type
    size() const
    {
      return shape_.size();
    }

    bool
    contains(size_type i, size_type j) const
    {
      return shape_.contains(i, j);
    }

    size_type
    element_index(size_type i, size_type j) const
    {
      return shape_.element_index(i, j);
    }

    T const&
    get_element(size_type i, size_type j) const
    {
      return storage_.get(shape_.element_index(i, j));
    }

    size_type
    row_start_index(size_type i) const
    {
      return shape_.row_start_index(i);
    }

    size_type
    col_start_index(size_type j) const
    {
      return shape_.col_start_index(j);
    }

    Offset_sequence
    row_indices(size_type i) const
    {
      return shape_.row_indices(i);
    }

    Offset_sequence
    col_indices(size_type j) const
    {
      return shape_.col_indices(j);
    }

    /**
     * @brief Copy the elements of row @p i, in row_indices order.
     */
    std::vector<T>
    get_row(size_type i) const
    {
      return gather(shape_.row_indices(i));
    }

    /**
     * @brief Copy the elements of column @p j, in col_indices order.
     */
    std::vector<T>
    get_col(size_type j) const
    {
      return gather(shape_.col_indices(j));
    }

    std::vector<Index>
    triangle_indices() const
    {
      return shape_.triangle_indices();
    }

  private:
    std::vector<T>
    gather(Offset_sequence const& offsets) const
    {
      std::vector<T> result;
      result.reserve(static_cast<std::size_t>(offsets.size()));
      for (auto offset : offsets) {
        result.push_back(storage_.get(offset));
      }
      return result;
    }

    Shape shape_;
    Triangle_storage<T> const& storage_;

  }; // end of class Packed_triangle

  /**
   * @brief Packed_triangle with write access to the storage.
   *
   * In the symmetric shapes (i, j) and (j, i) name the same slot, so a
   * write through one is visible through the other. The read-only view
   * is a private base; a mutable view does not convert to it.
   */
  template<typename Shape, typename T = config::value_type>
  class Packed_triangle_mut final : private Packed_triangle<Shape, T>
  {
    using base = Packed_triangle<Shape, T>;

  public:
    using size_type = config::size_type;
    using typename base::shape_type;
    using typename base::value_type;

    explicit Packed_triangle_mut(Mutable_triangle_storage<T>& storage)
      : base(storage)
      , storage_(storage)
    {}

    using base::shape;
    using base::n;
    using base::size;
    using base::contains;
    using base::element_index;
    using base::get_element;
    using base::row_start_index;
    using base::col_start_index;
    using base::row_indices;
    using base::col_indices;
    using base::get_row;
    using base::get_col;
    using base::triangle_indices;

    T&
    get_element_mut(size_type i, size_type j)
    {
      return storage_.get(this->shape().element_index(i, j));
    }

    void
    set_element(size_type i, size_type j, T value)
    {
      storage_.set(this->shape().element_index(i, j), std::move(value));
    }

  private:
    Mutable_triangle_storage<T>& storage_;

  }; // end of class Packed_triangle_mut

  template<typename T = config::value_type>
  using Lower_tri = Packed_triangle<Lower_shape, T>;

  template<typename T = config::value_type>
  using Lower_tri_mut = Packed_triangle_mut<Lower_shape, T>;

  template<typename T = config::value_type>
  using Upper_tri = Packed_triangle<Upper_shape, T>;

  template<typename T = config::value_type>
  using Upper_tri_mut = Packed_triangle_mut<Upper_shape, T>;

  template<typename T = config::value_type>
  using Simple_lower_tri = Packed_triangle<Simple_lower_shape, T>;

  template<typename T = config::value_type>
  using Simple_lower_tri_mut = Packed_triangle_mut<Simple_lower_shape, T>;

  template<typename T = config::value_type>
  using Simple_upper_tri = Packed_triangle<Simple_upper_shape, T>;

  template<typename T = config::value_type>
  using Simple_upper_tri_mut = Packed_triangle_mut<Simple_upper_shape, T>;

  template<typename T = config::value_type>
  using Symmetric_lower_tri = Packed_triangle<Symmetric_lower_shape, T>;

  template<typename T = config::value_type>
  using Symmetric_lower_tri_mut = Packed_triangle_mut<Symmetric_lower_shape, T>;

  template<typename T = config::value_type>
  using Symmetric_upper_tri = Packed_triangle<Symmetric_upper_shape, T>;

  template<typename T = config::value_type>
  using Symmetric_upper_tri_mut = Packed_triangle_mut<Symmetric_upper_shape, T>;

} // end of namespace tripack::data::detail
