#pragma once

//
// ... Standard header files
//
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... tripack header files
//
#include <tripack/config.hpp>
#include <tripack/data/Index.hpp>
#include <tripack/data/Lower_shape.hpp>
#include <tripack/data/Packed_storage.hpp>
#include <tripack/data/Simple_lower_shape.hpp>
#include <tripack/data/Simple_upper_shape.hpp>
#include <tripack/data/Symmetric_lower_shape.hpp>
#include <tripack/data/Symmetric_upper_shape.hpp>
#include <tripack/data/Upper_shape.hpp>

// adl_serializer specializations for non-default-constructible types.
// Index and Packed_storage have no default constructor, so get<Index>()
// and get<Packed_storage<T>>() require these specializations. The shapes
// are default constructible and use the to_json/from_json overloads
// declared next to them.

namespace nlohmann {

  template <>
  struct adl_serializer<tripack::data::detail::Index> {
    static tripack::data::detail::Index
    from_json(json const& j) {
      return tripack::data::detail::Index{
          j.at(0).get<tripack::config::size_type>(),
          j.at(1).get<tripack::config::size_type>()};
    }

    static void
    to_json(json& j, tripack::data::detail::Index const& idx) {
      j = {idx.row(), idx.column()};
    }
  };

  template <typename T>
  struct adl_serializer<tripack::data::detail::Packed_storage<T>> {
    static tripack::data::detail::Packed_storage<T>
    from_json(json const& j) {
      return tripack::data::detail::Packed_storage<T>{
          j.at("n").get<tripack::config::size_type>(),
          j.at("values").get<std::vector<T>>()};
    }

    static void
    to_json(json& j, tripack::data::detail::Packed_storage<T> const& storage) {
      auto values = storage.values();
      j = {{"n", storage.n()},
           {"values", std::vector<T>(values.begin(), values.end())}};
    }
  };

} // end of namespace nlohmann
