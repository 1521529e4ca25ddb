#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace craftiax {

class Store {
public:
  struct Settings {
    std::string trusted_verifier;
    std::string platform_fee_recipient;
    std::uint32_t platform_fee_percent = 0;
    std::string nft_base_uri;
    bool paused = false;
  };

  // Normalized record tables. Composite keys replace nested per-event maps.
  struct Tables {
    std::map<std::string, EventRecord> events;
    std::map<std::pair<std::string, std::string>, TierRecord> tiers;
    std::map<std::pair<std::string, std::string>, std::uint64_t> tickets;  // (owner, token id)
    std::map<std::pair<std::string, Currency>, std::uint64_t> balances;
    std::map<Currency, LedgerTotals> totals;
    std::map<std::string, std::uint64_t> nonces;
    std::map<Currency, PaymentLimits> limits;
    std::set<std::string> verified;
    std::map<std::string, std::int64_t> last_payment_unix;
    std::map<std::uint64_t, NftRecord> nfts;
    std::uint64_t next_nft_id = 0;
    Settings settings;
  };

  // All-or-nothing boundary around a group of table mutations. Destroying an
  // uncommitted transaction restores every table to its state at begin().
  class Transaction {
  public:
    explicit Transaction(Store& store);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Result commit();
    void rollback();
    [[nodiscard]] bool active() const { return active_; }

  private:
    Store& store_;
    bool active_ = false;
  };

  Result open(std::string_view data_dir, bool enable_snapshots);
  [[nodiscard]] bool restored_from_snapshot() const { return restored_from_snapshot_; }
  [[nodiscard]] bool in_transaction() const { return backup_.has_value(); }

  [[nodiscard]] Tables& tables() { return tables_; }
  [[nodiscard]] const Tables& tables() const { return tables_; }

  // Audit records staged inside a transaction become visible on commit only.
  void stage_audit(std::string_view kind, std::string_view actor, std::int64_t unix_ts,
                   std::vector<std::pair<std::string, std::string>> payload_fields);
  [[nodiscard]] const std::vector<AuditRecord>& audit_records() const { return audit_records_; }

  void record_rejection(std::string_view operation, const Result& result);
  [[nodiscard]] std::size_t rejected_request_count() const { return rejected_request_count_; }

  [[nodiscard]] std::string data_dir() const { return data_dir_; }

private:
  Result begin_transaction();
  Result commit_transaction();
  void rollback_transaction();

  Result load_snapshot();
  Result persist_snapshot() const;
  Result load_audit_log();
  Result append_audit_log(const std::vector<AuditRecord>& records) const;

  std::string data_dir_;
  std::string snapshot_path_;
  std::string audit_log_path_;
  std::string rejected_log_path_;
  bool enable_snapshots_ = true;
  bool restored_from_snapshot_ = false;

  Tables tables_;
  std::optional<Tables> backup_;
  std::vector<AuditRecord> pending_audit_;
  std::vector<AuditRecord> audit_records_;
  std::size_t rejected_request_count_ = 0;
};

}  // namespace craftiax
