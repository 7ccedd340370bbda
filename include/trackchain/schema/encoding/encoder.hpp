#pragma once
#include <trackchain/schema/primitives.hpp>
#include <optional>
#include <span>

namespace trackchain::schema::encoding {

// The codec is a build time choice selected by tag type, the same way the
// storage backend is. Call sites only see `encoder<Tag>`.
template <typename Library>
struct encoder {
  template <typename T>
  trackchain::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, trackchain::schema::bytes_t& out);

  template <typename T>
  T decode(const trackchain::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const trackchain::schema::bytes_view_t& bytes);
};

}  // namespace trackchain::schema::encoding
