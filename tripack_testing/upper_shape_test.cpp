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
#include <tripack/data/Upper_shape.hpp>

namespace tripack::testing {

  using tripack::data::detail::Index;
  using tripack::data::detail::Upper_shape;

  using size_type = tripack::config::size_type;
  using offsets = std::vector<size_type>;

  //   0 1 2 3
  //     4 5 6
  //       7 8
  //         9

  TEST_CASE("upper_shape - element_index", "[upper_shape]")
  {
    Upper_shape shape{4};
    CHECK(shape.element_index(0, 0) == 0);
    CHECK(shape.element_index(0, 3) == 3);
    CHECK(shape.element_index(1, 1) == 4);
    CHECK(shape.element_index(1, 2) == 5);
    CHECK(shape.element_index(2, 3) == 8);
    CHECK(shape.element_index(3, 3) == 9);
  }

  TEST_CASE("upper_shape - element_index outside the triangle",
            "[upper_shape]")
  {
    Upper_shape shape{4};
    CHECK_THROWS_AS(shape.element_index(1, 0), std::out_of_range);
    CHECK_THROWS_AS(shape.element_index(0, 4), std::out_of_range);
  }

  TEST_CASE("upper_shape - row and column starts", "[upper_shape]")
  {
    Upper_shape shape{4};
    CHECK(shape.row_start_index(0) == 0);
    CHECK(shape.row_start_index(1) == 4);
    CHECK(shape.row_start_index(2) == 7);
    CHECK(shape.row_start_index(3) == 9);
    CHECK(shape.col_start_index(2) == 2);
    CHECK_THROWS_AS(shape.col_start_index(4), std::out_of_range);
  }

  TEST_CASE("upper_shape - row_indices", "[upper_shape]")
  {
    Upper_shape shape{4};
    CHECK(shape.row_indices(0).to_vector() == offsets{0, 1, 2, 3});
    CHECK(shape.row_indices(1).to_vector() == offsets{4, 5, 6});
    CHECK(shape.row_indices(3).to_vector() == offsets{9});
  }

  TEST_CASE("upper_shape - col_indices", "[upper_shape]")
  {
    Upper_shape shape{4};
    CHECK(shape.col_indices(0).to_vector() == offsets{0});
    CHECK(shape.col_indices(2).to_vector() == offsets{2, 5, 7});
    CHECK(shape.col_indices(3).to_vector() == offsets{3, 6, 8, 9});
  }

  TEST_CASE("upper_shape - triangle_indices", "[upper_shape]")
  {
    Upper_shape shape{3};
    CHECK(shape.triangle_indices() == std::vector<Index>{
      Index{0, 0}, Index{0, 1}, Index{0, 2},
      Index{1, 1}, Index{1, 2},
      Index{2, 2}});
  }

  TEST_CASE("upper_shape - empty triangle", "[upper_shape]")
  {
    Upper_shape shape{0};
    CHECK(shape.size() == 0);
    CHECK(shape.triangle_indices().empty());
    CHECK_THROWS_AS(shape.row_indices(0), std::out_of_range);
  }

} // end of namespace tripack::testing
