#pragma once

//
// ... Standard header files
//
#include <span>
#include <string>
#include <vector>

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/Triangle_storage.hpp>
#include <tripack/data/import.hpp>

namespace tripack::data::detail {

  /**
   * @brief A packed sequence held in a std::vector whose length is fixed
   * at construction.
   *
   * The storage knows its axis length but not its shape; binding it to
   * a Packed_triangle checks that the lengths agree.
   */
  template<typename T = config::value_type>
  class Packed_storage final : public Mutable_triangle_storage<T>
  {
  public:
    using size_type = config::size_type;

    /**
     * @brief Take ownership of @p values as the packed sequence of an
     * n by n triangle.
     *
     * @throws std::invalid_argument if @p n is negative.
     */
    Packed_storage(size_type n, std::vector<T> values)
      : n_(n)
      , values_(std::move(values))
    {
      if (n_ < 0) {
        throw invalid_argument(
          "Packed_storage: negative axis length " + std::to_string(n_));
      }
    }

    /**
     * @brief Allocate @p size copies of @p fill.
     */
    Packed_storage(size_type n, size_type size, T const& fill)
      : Packed_storage(n, std::vector<T>(checked_size(size), fill))
    {}

    size_type
    n() const override
    {
      return n_;
    }

    size_type
    size() const override
    {
      return static_cast<size_type>(values_.size());
    }

    /**
     * @throws std::out_of_range if @p offset is not in [0, size()).
     */
    T const&
    get(size_type offset) const override
    {
      check_offset(offset);
      return values_[static_cast<std::size_t>(offset)];
    }

    T&
    get(size_type offset) override
    {
      check_offset(offset);
      return values_[static_cast<std::size_t>(offset)];
    }

    std::span<T const>
    values() const
    {
      return {values_.data(), values_.size()};
    }

    std::span<T>
    values()
    {
      return {values_.data(), values_.size()};
    }

  private:
    void
    check_offset(size_type offset) const
    {
      if (offset < 0 || offset >= size()) {
        throw out_of_range(
          "Packed_storage: offset " + std::to_string(offset)
          + " out of range for size " + std::to_string(size()));
      }
    }

    static std::size_t
    checked_size(size_type size)
    {
      if (size < 0) {
        throw invalid_argument(
          "Packed_storage: negative size " + std::to_string(size));
      }
      return static_cast<std::size_t>(size);
    }

    size_type n_;
    std::vector<T> values_;

  }; // end of class Packed_storage

} // end of namespace tripack::data::detail
