#include <tripack/data/Offset_sequence.hpp>

//
// ... Standard header files
//
#include <algorithm>
#include <string>

//
// ... tripack header files
//
#include <tripack/data/triangular_number.hpp>

namespace tripack::data::detail {

  Offset_sequence
  Offset_sequence::contiguous(size_type first, size_type count)
  {
    Offset_sequence result;
    result.append(Segment{Kind::contiguous, first, 0, count});
    return result;
  }

  Offset_sequence
  Offset_sequence::lower_column(
    size_type first_row, size_type column, size_type count)
  {
    Offset_sequence result;
    result.append(Segment{Kind::lower_column, first_row, column, count});
    return result;
  }

  Offset_sequence
  Offset_sequence::upper_column(size_type column, size_type n)
  {
    Offset_sequence result;
    result.append(Segment{Kind::upper_column, column, n, column + 1});
    return result;
  }

  Offset_sequence
  Offset_sequence::then(Offset_sequence const& other) const
  {
    Offset_sequence result = *this;
    for (auto const& segment : other.segments_) {
      result.append(segment);
    }
    return result;
  }

  config::size_type
  Offset_sequence::size() const
  {
    size_type total = 0;
    for (auto const& segment : segments_) {
      total += segment.count;
    }
    return total;
  }

  bool
  Offset_sequence::empty() const
  {
    return segments_.empty();
  }

  Offset_sequence::value_type
  Offset_sequence::operator[](size_type position) const
  {
    if (position >= 0) {
      auto k = position;
      for (auto const& segment : segments_) {
        if (k < segment.count) {
          return offset(segment, k);
        }
        k -= segment.count;
      }
    }
    throw out_of_range(
      "Offset_sequence: position " + std::to_string(position)
      + " out of range");
  }

  Offset_sequence::iterator
  Offset_sequence::begin() const
  {
    return iterator(this, 0);
  }

  Offset_sequence::iterator
  Offset_sequence::end() const
  {
    return iterator(this, segments_.size());
  }

  std::vector<Offset_sequence::value_type>
  Offset_sequence::to_vector() const
  {
    std::vector<value_type> result;
    result.reserve(static_cast<std::size_t>(size()));
    for (auto value : *this) {
      result.push_back(value);
    }
    return result;
  }

  bool
  operator==(Offset_sequence const& seq1, Offset_sequence const& seq2)
  {
    return seq1.size() == seq2.size()
      && std::equal(seq1.begin(), seq1.end(), seq2.begin());
  }

  Offset_sequence::value_type
  Offset_sequence::offset(Segment const& segment, size_type k)
  {
    switch (segment.kind) {
    case Kind::contiguous:
      return segment.first + k;
    case Kind::lower_column:
      return tri_num(segment.first + k) + segment.second;
    case Kind::upper_column:
      return tri_num(segment.second) - tri_num(segment.second - k)
        + segment.first - k;
    }
    assert(false);
    return 0;
  }

  void
  Offset_sequence::append(Segment const& segment)
  {
    if (segment.count < 0) {
      throw logic_error("Offset_sequence: negative segment length");
    }
    if (segment.count > 0) {
      segments_.push_back(segment);
    }
  }

} // end of namespace tripack::data::detail
