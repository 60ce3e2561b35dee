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
#include <tripack/data/Lower_shape.hpp>

namespace tripack::testing {

  using tripack::data::detail::Index;
  using tripack::data::detail::Lower_shape;

  using size_type = tripack::config::size_type;
  using offsets = std::vector<size_type>;

  //   0
  //   1 2
  //   3 4 5
  //   6 7 8 9

  TEST_CASE("lower_shape - size", "[lower_shape]")
  {
    CHECK(Lower_shape{0}.size() == 0);
    CHECK(Lower_shape{1}.size() == 1);
    CHECK(Lower_shape{4}.size() == 10);
  }

  TEST_CASE("lower_shape - default_construction", "[lower_shape]")
  {
    Lower_shape shape{};
    CHECK(shape.n() == 0);
    CHECK(shape.size() == 0);
  }

  TEST_CASE("lower_shape - negative axis length", "[lower_shape]")
  {
    CHECK_THROWS_AS(Lower_shape{-1}, std::invalid_argument);
  }

  TEST_CASE("lower_shape - element_index", "[lower_shape]")
  {
    Lower_shape shape{4};
    CHECK(shape.element_index(0, 0) == 0);
    CHECK(shape.element_index(1, 0) == 1);
    CHECK(shape.element_index(1, 1) == 2);
    CHECK(shape.element_index(2, 1) == 4);
    CHECK(shape.element_index(3, 2) == 8);
    CHECK(shape.element_index(3, 3) == 9);
  }

  TEST_CASE("lower_shape - element_index outside the triangle",
            "[lower_shape]")
  {
    Lower_shape shape{4};
    CHECK_THROWS_AS(shape.element_index(0, 1), std::out_of_range);
    CHECK_THROWS_AS(shape.element_index(4, 0), std::out_of_range);
    CHECK_THROWS_AS(shape.element_index(2, -1), std::out_of_range);
  }

  TEST_CASE("lower_shape - row and column starts", "[lower_shape]")
  {
    Lower_shape shape{4};
    CHECK(shape.row_start_index(3) == 6);
    CHECK(shape.row_start_index(0) == 0);
    CHECK(shape.col_start_index(1) == 2);
    CHECK(shape.col_start_index(3) == 9);
    CHECK_THROWS_AS(shape.row_start_index(4), std::out_of_range);
    CHECK_THROWS_AS(shape.col_start_index(-1), std::out_of_range);
  }

  TEST_CASE("lower_shape - row_indices", "[lower_shape]")
  {
    Lower_shape shape{4};
    CHECK(shape.row_indices(0).to_vector() == offsets{0});
    CHECK(shape.row_indices(2).to_vector() == offsets{3, 4, 5});
    CHECK(shape.row_indices(3).to_vector() == offsets{6, 7, 8, 9});
  }

  TEST_CASE("lower_shape - col_indices", "[lower_shape]")
  {
    Lower_shape shape{4};
    CHECK(shape.col_indices(0).to_vector() == offsets{0, 1, 3, 6});
    CHECK(shape.col_indices(1).to_vector() == offsets{2, 4, 7});
    CHECK(shape.col_indices(3).to_vector() == offsets{9});
    CHECK_THROWS_AS(shape.col_indices(4), std::out_of_range);
  }

  TEST_CASE("lower_shape - triangle_indices", "[lower_shape]")
  {
    Lower_shape shape{3};
    CHECK(shape.triangle_indices() == std::vector<Index>{
      Index{0, 0},
      Index{1, 0}, Index{1, 1},
      Index{2, 0}, Index{2, 1}, Index{2, 2}});
  }

} // end of namespace tripack::testing
