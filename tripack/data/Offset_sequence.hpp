#pragma once

//
// ... Standard header files
//
#include <cstddef>
#include <iterator>
#include <vector>

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/import.hpp>

namespace tripack::data::detail {

  /**
   * @brief A lazy, restartable sequence of packed offsets.
   *
   * The sequence is a concatenation of closed-form segments. Each offset
   * is computed when it is dereferenced, so a row or column query costs
   * nothing until it is iterated, and can be iterated any number of
   * times.
   *
   * Three segment kinds cover every row and column scan of the packed
   * triangle layouts:
   *
   * - contiguous:   @f$ first + k @f$
   * - lower column: @f$ T(first\_row + k) + column @f$
   * - upper column: @f$ T(n) - T(n - k) + column - k @f$
   *
   * for @f$ k = 0, \ldots, count - 1 @f$.
   */
  class Offset_sequence final {
    enum class Kind { contiguous, lower_column, upper_column };

    struct Segment {
      Kind kind;
      config::size_type first;
      config::size_type second;
      config::size_type count;
    };

  public:
    using size_type = config::size_type;
    using value_type = config::size_type;

    class iterator {
    public:
      using iterator_category = std::input_iterator_tag;
      using value_type = Offset_sequence::value_type;
      using difference_type = std::ptrdiff_t;
      using pointer = void;
      using reference = value_type;

      iterator() = default;

      value_type
      operator*() const
      {
        return offset(sequence_->segments_[segment_], position_);
      }

      iterator&
      operator++()
      {
        ++position_;
        if (position_ == sequence_->segments_[segment_].count) {
          ++segment_;
          position_ = 0;
        }
        return *this;
      }

      iterator
      operator++(int)
      {
        auto old = *this;
        ++*this;
        return old;
      }

      friend bool
      operator==(iterator const& it1, iterator const& it2)
      {
        return it1.sequence_ == it2.sequence_
          && it1.segment_ == it2.segment_
          && it1.position_ == it2.position_;
      }

    private:
      friend class Offset_sequence;

      iterator(Offset_sequence const* sequence, std::size_t segment)
        : sequence_(sequence)
        , segment_(segment)
      {}

      Offset_sequence const* sequence_{nullptr};
      std::size_t segment_{0};
      size_type position_{0};

    }; // end of class iterator

    using const_iterator = iterator;

    /**
     * @brief The empty sequence.
     */
    Offset_sequence() = default;

    /**
     * @brief The run @c first, @c first+1, ..., @c first+count-1.
     */
    static Offset_sequence
    contiguous(size_type first, size_type count);

    /**
     * @brief Column @p column of a diagonal-inclusive lower triangle,
     * starting at row @p first_row and spanning @p count rows.
     */
    static Offset_sequence
    lower_column(size_type first_row, size_type column, size_type count);

    /**
     * @brief Column @p column of a diagonal-inclusive upper triangle of
     * axis length @p n: rows 0 through @p column.
     */
    static Offset_sequence
    upper_column(size_type column, size_type n);

    /**
     * @brief This sequence followed by @p other.
     */
    Offset_sequence
    then(Offset_sequence const& other) const;

    size_type
    size() const;

    bool
    empty() const;

    /**
     * @brief The offset at @p position.
     *
     * @throws std::out_of_range if @p position is not in [0, size()).
     */
    value_type
    operator[](size_type position) const;

    iterator
    begin() const;

    iterator
    end() const;

    std::vector<value_type>
    to_vector() const;

    friend bool
    operator==(Offset_sequence const& seq1, Offset_sequence const& seq2);

  private:
    static value_type
    offset(Segment const& segment, size_type k);

    void
    append(Segment const& segment);

    // Segments are never empty, so end() is one past the last segment.
    std::vector<Segment> segments_;

  }; // end of class Offset_sequence

} // end of namespace tripack::data::detail
