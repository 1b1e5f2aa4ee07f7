#pragma once

#include <custody/schema/encoding/scale/encoder.hpp>
#include <custody/schema/history_entry.hpp>
#include <custody/schema/key/engine_keys.hpp>
#include <custody/schema/ledger_event.hpp>
#include <custody/schema/primitives.hpp>
#include <custody/schema/record_state.hpp>
#include <custody/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace custody::execution {

using encoder_t = custody::schema::encoding::scale_encoder_t;
using storage_t =
    custody::storage::storage<custody::storage::rocksdb_storage_tag>;

/// Keyed record store plus append-only history for one ledger.
///
/// Writes are staged in nested frames. A frame opened while another one is
/// outstanding (a re-entrant call) sees every write of the frames below it.
/// Committing a nested frame folds it into its parent; only the outermost
/// commit reaches RocksDB, as a single write batch. Dropping a frame without
/// committing discards it.
class ledger_store final {
 public:
  /// RAII handle over one frame. Rolls back on destruction unless committed.
  class scope final {
   public:
    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;
    scope(scope&& other) noexcept;
    scope& operator=(scope&&) = delete;
    ~scope();

    /// Commit the frame. Returns the events that became durable, which is
    /// empty for a nested frame.
    std::vector<custody::schema::ledger_event_t> commit();

   private:
    friend class ledger_store;
    scope(ledger_store& store, std::size_t depth);

    ledger_store* store_;
    std::size_t depth_;
    bool open_{true};
  };

  ledger_store(encoder_t& encoder,
               storage_t& storage,
               const custody::schema::ledger_id_t& ledger);

  ledger_store(const ledger_store&) = delete;
  ledger_store& operator=(const ledger_store&) = delete;

  scope begin();
  std::size_t depth() const;
  const custody::schema::ledger_id_t& ledger_id() const;

  std::optional<custody::schema::record_state_t> get(
      const custody::schema::record_key_t& key) const;
  /// Insert or overwrite. Reserved for transition logic.
  void put(const custody::schema::record_state_t& record);

  std::optional<custody::schema::principal_id_t> owner() const;
  void set_owner(const custody::schema::principal_id_t& owner);
  bool is_member(const custody::schema::principal_id_t& principal) const;
  void set_member(const custody::schema::principal_id_t& principal,
                  bool member);

  custody::schema::amount_t custodied() const;
  void set_custodied(const custody::schema::amount_t& amount);

  /// Register a newly created record in the ledger-wide index and in the
  /// index of its (kind, parent) group.
  void index(const custody::schema::record_state_t& record);
  uint64_t index_size(const custody::schema::key::index_scope_t& scope) const;
  std::optional<custody::schema::record_key_t> index_at(
      const custody::schema::key::index_scope_t& scope,
      uint64_t ordinal) const;

  /// Append to the history log; assigns and returns the sequence number.
  uint64_t append(custody::schema::history_entry_t entry);
  uint64_t history_size() const;
  std::optional<custody::schema::history_entry_t> history_at(
      uint64_t sequence) const;
  /// Last min(n, size) entries, most recent first.
  std::vector<custody::schema::history_entry_t> recent(std::size_t n) const;
  /// Up to `limit` entries starting at `offset`, oldest first.
  std::vector<custody::schema::history_entry_t> history_page(
      uint64_t offset,
      std::size_t limit) const;

  /// Persist the event in the current frame and assign its id (from 1).
  uint64_t stage_event(custody::schema::ledger_event_t& event);
  uint64_t last_event_id() const;
  std::optional<custody::schema::ledger_event_t> event_at(
      uint64_t event_id) const;

 private:
  struct frame final {
    std::map<custody::schema::bytes_t, custody::schema::bytes_t> writes;
    std::vector<custody::schema::ledger_event_t> events;
  };

  std::optional<custody::schema::bytes_t> read_bytes(
      const custody::schema::bytes_t& key) const;

  template <typename T>
  std::optional<T> read(const custody::schema::bytes_t& key) const {
    auto bytes = read_bytes(key);
    if (!bytes) {
      return std::nullopt;
    }
    return encoder_.decode<T>(
        custody::schema::bytes_view_t{bytes->data(), bytes->size()});
  }

  template <typename T>
  void write(custody::schema::bytes_t key, const T& value) {
    top().writes[std::move(key)] = encoder_.encode(value);
  }

  frame& top();
  std::vector<custody::schema::ledger_event_t> commit_frame(std::size_t depth);
  void rollback_frame(std::size_t depth);

  encoder_t& encoder_;
  storage_t& storage_;
  custody::schema::ledger_id_t ledger_;
  std::vector<frame> frames_;
};

}  // namespace custody::execution
