#include <tripack/data/Index.hpp>

namespace tripack::data::detail{

  Index::Index(size_type row, size_type column)
      : row_(row)
      , column_(column)
    {
      if (row_ < 0 || column_ < 0) {
        throw out_of_range("invalid matrix index");
      }
    }

  config::size_type
  Index::row() const { return row_; }

  config::size_type
  Index::column() const { return column_; }

  Index
  Index::transposed() const { return Index(column_, row_); }

  bool
  Index::is_diagonal() const { return row_ == column_; }

  Index
  Index::lower() const { return row_ < column_ ? transposed() : *this; }

  Index
  Index::upper() const { return row_ > column_ ? transposed() : *this; }

  bool
  operator==(const Index& index1, const Index& index2){
    return index1.row_ == index2.row_ && index1.column_ == index2.column_;
  }

} // end of namespace tripack::data::detail
