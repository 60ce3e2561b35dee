#include <tripack/data/shape_support.hpp>

//
// ... Standard header files
//
#include <string>

//
// ... tripack header files
//
#include <tripack/data/triangular_number.hpp>

namespace tripack::data::detail {

  void
  check_axis_length(char const* shape, size_type n, size_type minimum)
  {
    if (n < minimum) {
      throw invalid_argument(
        std::string(shape) + ": axis length " + std::to_string(n)
        + " is below the minimum of " + std::to_string(minimum));
    }
    tri_num(n);
  }

  void
  check_coordinate(bool valid, char const* operation, size_type i, size_type j)
  {
    if (!valid) {
      throw out_of_range(
        std::string(operation) + ": invalid coordinate ("
        + std::to_string(i) + ", " + std::to_string(j) + ")");
    }
  }

  void
  check_axis_index(bool valid, char const* operation, size_type index)
  {
    if (!valid) {
      throw out_of_range(
        std::string(operation) + ": invalid index " + std::to_string(index));
    }
  }

  void
  shape_to_json(json& j, char const* kind, size_type n)
  {
    j = {{"kind", kind}, {"n", n}};
  }

  size_type
  shape_from_json(json const& j, char const* kind)
  {
    auto actual = j.at("kind").get<std::string>();
    if (actual != kind) {
      throw invalid_argument(
        "expected a " + std::string(kind) + " shape, got " + actual);
    }
    return j.at("n").get<size_type>();
  }

} // end of namespace tripack::data::detail
