//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <stdexcept>
#include <vector>

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/Simple_lower_shape.hpp>

namespace tripack::testing {

  using tripack::data::detail::Index;
  using tripack::data::detail::Simple_lower_shape;

  using size_type = tripack::config::size_type;
  using offsets = std::vector<size_type>;

  // n = 5
  //
  //   row 1:  0
  //   row 2:  1 2
  //   row 3:  3 4 5
  //   row 4:  6 7 8 9

  TEST_CASE("simple_lower_shape - size", "[simple_lower_shape]")
  {
    CHECK(Simple_lower_shape{1}.size() == 0);
    CHECK(Simple_lower_shape{2}.size() == 1);
    CHECK(Simple_lower_shape{5}.size() == 10);
  }

  TEST_CASE("simple_lower_shape - axis length below one",
            "[simple_lower_shape]")
  {
    CHECK_THROWS_AS(Simple_lower_shape{0}, std::invalid_argument);
    CHECK_THROWS_AS(Simple_lower_shape{-3}, std::invalid_argument);
  }

  TEST_CASE("simple_lower_shape - element_index", "[simple_lower_shape]")
  {
    Simple_lower_shape shape{5};
    CHECK(shape.element_index(1, 0) == 0);
    CHECK(shape.element_index(2, 0) == 1);
    CHECK(shape.element_index(2, 1) == 2);
    CHECK(shape.element_index(3, 0) == 3);
    CHECK(shape.element_index(3, 1) == 4);
    CHECK(shape.element_index(3, 2) == 5);
    CHECK(shape.element_index(4, 0) == 6);
    CHECK(shape.element_index(4, 1) == 7);
    CHECK(shape.element_index(4, 2) == 8);
    CHECK(shape.element_index(4, 3) == 9);
  }

  TEST_CASE("simple_lower_shape - diagonal is rejected",
            "[simple_lower_shape]")
  {
    Simple_lower_shape shape{5};
    for (size_type i = 0; i < 5; ++i) {
      CHECK_FALSE(shape.contains(i, i));
      CHECK_THROWS_AS(shape.element_index(i, i), std::out_of_range);
    }
  }

  TEST_CASE("simple_lower_shape - upper half is rejected",
            "[simple_lower_shape]")
  {
    Simple_lower_shape shape{5};
    CHECK_THROWS_AS(shape.element_index(0, 1), std::out_of_range);
    CHECK_THROWS_AS(shape.element_index(2, 3), std::out_of_range);
    CHECK_THROWS_AS(shape.element_index(5, 0), std::out_of_range);
  }

  TEST_CASE("simple_lower_shape - row_start_index", "[simple_lower_shape]")
  {
    Simple_lower_shape shape{5};
    CHECK(shape.row_start_index(1) == 0);
    CHECK(shape.row_start_index(2) == 1);
    CHECK(shape.row_start_index(3) == 3);
    CHECK(shape.row_start_index(4) == 6);
    CHECK_THROWS_AS(shape.row_start_index(0), std::out_of_range);
  }

  TEST_CASE("simple_lower_shape - col_start_index", "[simple_lower_shape]")
  {
    Simple_lower_shape shape{5};
    CHECK(shape.col_start_index(0) == 0);
    CHECK(shape.col_start_index(1) == 2);
    CHECK(shape.col_start_index(2) == 5);
    CHECK(shape.col_start_index(3) == 9);
    CHECK_THROWS_AS(shape.col_start_index(4), std::out_of_range);
  }

  TEST_CASE("simple_lower_shape - row_indices", "[simple_lower_shape]")
  {
    Simple_lower_shape shape{5};
    CHECK(shape.row_indices(1).to_vector() == offsets{0});
    CHECK(shape.row_indices(2).to_vector() == offsets{1, 2});
    CHECK(shape.row_indices(3).to_vector() == offsets{3, 4, 5});
    CHECK(shape.row_indices(4).to_vector() == offsets{6, 7, 8, 9});
  }

  TEST_CASE("simple_lower_shape - row zero does not exist",
            "[simple_lower_shape]")
  {
    Simple_lower_shape shape{5};
    CHECK_THROWS_AS(shape.row_indices(0), std::out_of_range);
  }

  TEST_CASE("simple_lower_shape - col_indices", "[simple_lower_shape]")
  {
    Simple_lower_shape shape{5};
    CHECK(shape.col_indices(0).to_vector() == offsets{0, 1, 3, 6});
    CHECK(shape.col_indices(1).to_vector() == offsets{2, 4, 7});
    CHECK(shape.col_indices(2).to_vector() == offsets{5, 8});
    CHECK(shape.col_indices(3).to_vector() == offsets{9});
    CHECK(shape.col_indices(4).empty());
    CHECK_THROWS_AS(shape.col_indices(5), std::out_of_range);
  }

  TEST_CASE("simple_lower_shape - triangle_indices", "[simple_lower_shape]")
  {
    Simple_lower_shape shape{5};
    CHECK(shape.triangle_indices() == std::vector<Index>{
      Index{1, 0},
      Index{2, 0}, Index{2, 1},
      Index{3, 0}, Index{3, 1}, Index{3, 2},
      Index{4, 0}, Index{4, 1}, Index{4, 2}, Index{4, 3}});
  }

  TEST_CASE("simple_lower_shape - triangle_indices of an empty triangle",
            "[simple_lower_shape]")
  {
    CHECK(Simple_lower_shape{1}.triangle_indices().empty());
  }

} // end of namespace tripack::testing
