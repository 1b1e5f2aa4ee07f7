#pragma once

#include <boost/endian/buffers.hpp>
#include <custody/schema/primitives.hpp>
#include <custody/schema/record_kind.hpp>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Custody workflow: Canonical key prefixes and key codecs for ledger state,
// history and events. Every key is scoped by the ledger id so independent
// ledgers can share one store.
namespace custody::schema::key {

inline constexpr std::string_view kOwnerKeyPrefix{"SYS|STATE|OWNER|"};
inline constexpr std::string_view kMemberKeyPrefix{"SYS|STATE|MEMBER|"};
inline constexpr std::string_view kRecordKeyPrefix{"SYS|STATE|RECORD|"};
inline constexpr std::string_view kIndexKeyPrefix{"SYS|STATE|INDEX|"};
inline constexpr std::string_view kIndexSizeKeyPrefix{
    "SYS|STATE|INDEX_SIZE|"};
inline constexpr std::string_view kCustodiedKeyPrefix{
    "SYS|STATE|CUSTODIED|"};
inline constexpr std::string_view kHistorySeqKeyPrefix{
    "SYS|STATE|HISTORY_SEQ|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

/// Index scope: all records of the ledger when both parts are empty,
/// otherwise the records of one kind under one parent.
using index_scope_t = std::tuple<std::optional<custody::schema::record_kind_t>,
                                 std::optional<custody::schema::record_key_t>>;

template <typename Encoder, typename T>
custody::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

/// Append a big-endian ordinal so RocksDB iteration follows insertion order.
inline void append_ordinal(custody::schema::bytes_t& key,
                           const uint64_t ordinal) {
  auto buffer = boost::endian::big_uint64_buf_t{ordinal};
  auto begin = buffer.data();
  key.insert(std::end(key), begin, begin + sizeof(buffer));
}

template <typename Encoder>
custody::schema::bytes_t make_owner_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger) {
  return make_prefixed_key(encoder, kOwnerKeyPrefix, ledger);
}

template <typename Encoder>
custody::schema::bytes_t make_member_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger,
    const custody::schema::principal_id_t& member) {
  return make_prefixed_key(encoder, kMemberKeyPrefix,
                           std::tuple{ledger, member});
}

template <typename Encoder>
custody::schema::bytes_t make_record_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger,
    const custody::schema::record_key_t& record) {
  return make_prefixed_key(encoder, kRecordKeyPrefix,
                           std::tuple{ledger, record});
}

template <typename Encoder>
custody::schema::bytes_t make_custodied_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger) {
  return make_prefixed_key(encoder, kCustodiedKeyPrefix, ledger);
}

template <typename Encoder>
custody::schema::bytes_t make_index_size_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger,
    const index_scope_t& scope) {
  return make_prefixed_key(encoder, kIndexSizeKeyPrefix,
                           std::tuple{ledger, scope});
}

template <typename Encoder>
custody::schema::bytes_t make_index_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger,
    const index_scope_t& scope,
    const uint64_t ordinal) {
  auto key = make_prefixed_key(encoder, kIndexKeyPrefix,
                               std::tuple{ledger, scope});
  append_ordinal(key, ordinal);
  return key;
}

template <typename Encoder>
custody::schema::bytes_t make_history_sequence_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger) {
  return make_prefixed_key(encoder, kHistorySeqKeyPrefix, ledger);
}

template <typename Encoder>
custody::schema::bytes_t make_history_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger,
    const uint64_t sequence) {
  auto key = make_prefixed_key(encoder, kHistoryPrefix, ledger);
  append_ordinal(key, sequence);
  return key;
}

template <typename Encoder>
custody::schema::bytes_t make_event_sequence_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix, ledger);
}

template <typename Encoder>
custody::schema::bytes_t make_event_key(
    Encoder& encoder,
    const custody::schema::ledger_id_t& ledger,
    const uint64_t event_id) {
  auto key = make_prefixed_key(encoder, kEventPrefix, ledger);
  append_ordinal(key, event_id);
  return key;
}

/// Record key of an attendee admitted to an event: one per (event, principal).
template <typename Encoder>
custody::schema::record_key_t make_attendee_record_key(
    Encoder& encoder,
    const custody::schema::record_key_t& event,
    const custody::schema::principal_id_t& attendee) {
  return encoder.encode(std::tuple{event, attendee});
}

}  // namespace custody::schema::key
