#include <blake3.h>
#include <custody/blake3/hash.hpp>

namespace custody::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  hasher& update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
    return *this;
  }

  custody::schema::hash32_t finalize() const {
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<custody::schema::hash32_t>);
    auto output = custody::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

custody::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str.data(), str.size()).finalize();
}

custody::schema::hash32_t hash(const custody::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes.data(), bytes.size()).finalize();
}

}  // namespace custody::blake3
