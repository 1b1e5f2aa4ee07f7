#pragma once
#include <custody/common/critical.hpp>
#include <custody/schema/encoding/encoder.hpp>
#include <custody/schema/history_entry.hpp>
#include <custody/schema/ledger_event.hpp>
#include <custody/schema/record_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace custody::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  custody::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, custody::schema::bytes_t& out);

  template <typename T>
  T decode(const custody::schema::bytes_view_t& bytes);
};

template <typename T>
custody::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    custody::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        custody::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const custody::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    custody::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace custody::schema::encoding
