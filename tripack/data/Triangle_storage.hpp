#pragma once

//
// ... Standard header files
//
#include <utility>

//
// ... tripack header files
//
#include <tripack/config.hpp>

namespace tripack::data::detail {

  /**
   * @brief Read access to a fixed-length packed sequence.
   *
   * This is everything the triangle views require of a container: the
   * axis length of the matrix it represents, its packed length, and
   * element access by offset. The length never changes after
   * construction.
   *
   * @see Mutable_triangle_storage, Packed_storage
   */
  template<typename T = config::value_type>
  class Triangle_storage
  {
  public:
    using size_type = config::size_type;
    using value_type = T;

    virtual ~Triangle_storage() = default;

    /**
     * @brief Return the axis length of the represented matrix.
     */
    virtual size_type
    n() const = 0;

    /**
     * @brief Return the number of stored elements.
     */
    virtual size_type
    size() const = 0;

    virtual T const&
    get(size_type offset) const = 0;

  }; // end of class Triangle_storage

  /**
   * @brief Read and write access to a fixed-length packed sequence.
   */
  template<typename T = config::value_type>
  class Mutable_triangle_storage : public Triangle_storage<T>
  {
  public:
    using size_type = config::size_type;

    using Triangle_storage<T>::get;

    virtual T&
    get(size_type offset) = 0;

    void
    set(size_type offset, T value)
    {
      get(offset) = std::move(value);
    }

  }; // end of class Mutable_triangle_storage

} // end of namespace tripack::data::detail
