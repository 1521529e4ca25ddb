#include "core/storage/store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_map>

#include "core/model/enum_names.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace craftiax {
namespace {

constexpr std::string_view kSnapshotFile = "state.snapshot";
constexpr std::string_view kAuditLogFile = "audit.log";
constexpr std::string_view kRejectedLogFile = "rejected-requests.log";
constexpr std::string_view kSnapshotHeader = "# craftiax ledger snapshot v1";

using Fields = std::vector<std::pair<std::string, std::string>>;

class FieldReader {
public:
  explicit FieldReader(std::unordered_map<std::string, std::string> fields) : fields_(std::move(fields)) {}

  std::string text(const std::string& key) {
    const auto it = fields_.find(key);
    if (it == fields_.end()) {
      ok_ = false;
      return {};
    }
    return it->second;
  }

  std::uint64_t u64(const std::string& key) {
    std::uint64_t value = 0;
    if (!util::parse_uint64(text(key), value)) {
      ok_ = false;
    }
    return value;
  }

  std::int64_t i64(const std::string& key) {
    std::int64_t value = 0;
    if (!util::parse_int64(text(key), value)) {
      ok_ = false;
    }
    return value;
  }

  Currency currency(const std::string& key) {
    const auto parsed = currency_from_string(text(key));
    if (!parsed.has_value()) {
      ok_ = false;
      return Currency::Native;
    }
    return *parsed;
  }

  bool flag(const std::string& key) { return text(key) == "1"; }

  [[nodiscard]] bool ok() const { return ok_; }

private:
  std::unordered_map<std::string, std::string> fields_;
  bool ok_ = true;
};

std::string snapshot_line(std::string_view table, Fields fields) {
  std::string line{table};
  line.push_back('\t');
  line.append(util::to_hex(util::canonical_join(std::move(fields))));
  line.push_back('\n');
  return line;
}

// Kind, actor and payload are hex encoded; identities are opaque and may hold separators.
std::string serialize_audit_line(const AuditRecord& record) {
  std::ostringstream out;
  out << record.record_id << '\t' << util::to_hex(record.kind) << '\t' << util::to_hex(record.actor) << '\t'
      << record.unix_ts << '\t' << util::to_hex(record.payload) << '\n';
  return out.str();
}

bool parse_audit_line(std::string_view line, AuditRecord& out) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == '\t') {
      parts.push_back(line.substr(start, i - start));
      start = i + 1U;
    }
  }
  if (parts.size() != 5U) {
    return false;
  }

  out.record_id = std::string{parts[0]};
  out.kind = util::from_hex(parts[1]);
  out.actor = util::from_hex(parts[2]);
  if (!util::parse_int64(parts[3], out.unix_ts)) {
    return false;
  }
  out.payload = util::from_hex(parts[4]);
  return !out.record_id.empty() && !out.kind.empty() && (parts[2].empty() || !out.actor.empty()) &&
         (parts[4].empty() || !out.payload.empty());
}

Result apply_snapshot_record(std::string_view table, FieldReader& reader, Store::Tables& tables) {
  if (table == "settings") {
    tables.settings.trusted_verifier = reader.text("trusted_verifier");
    tables.settings.platform_fee_recipient = reader.text("platform_fee_recipient");
    tables.settings.platform_fee_percent = static_cast<std::uint32_t>(reader.u64("platform_fee_percent"));
    tables.settings.nft_base_uri = reader.text("nft_base_uri");
    tables.settings.paused = reader.flag("paused");
    tables.next_nft_id = reader.u64("next_nft_id");
  } else if (table == "event") {
    EventRecord event;
    event.event_id = reader.text("event_id");
    event.name = reader.text("name");
    event.description = reader.text("description");
    event.start_unix = reader.i64("start_unix");
    event.end_unix = reader.i64("end_unix");
    event.organizer = reader.text("organizer");
    const auto status = event_status_from_string(reader.text("status"));
    event.status = status.value_or(EventStatus::Draft);
    event.currency = reader.currency("currency");
    event.commission_percent = static_cast<std::uint32_t>(reader.u64("commission_percent"));
    event.commission_recipient = reader.text("commission_recipient");
    event.tier_ids = util::split_csv(reader.text("tier_ids"));
    event.created_unix = reader.i64("created_unix");
    if (!status.has_value()) {
      return Result::failure(ErrorCode::PersistenceFailed, "Snapshot event has an unknown status.");
    }
    tables.events[event.event_id] = std::move(event);
  } else if (table == "tier") {
    TierRecord tier;
    tier.event_id = reader.text("event_id");
    tier.tier_id = reader.text("tier_id");
    tier.price = reader.u64("price");
    tier.max_quantity = reader.u64("max_quantity");
    tier.sold_count = reader.u64("sold_count");
    tier.active = reader.flag("active");
    tables.tiers[{tier.event_id, tier.tier_id}] = std::move(tier);
  } else if (table == "ticket") {
    tables.tickets[{reader.text("owner"), reader.text("token_id")}] = reader.u64("quantity");
  } else if (table == "balance") {
    tables.balances[{reader.text("owner"), reader.currency("currency")}] = reader.u64("amount");
  } else if (table == "total") {
    LedgerTotals& totals = tables.totals[reader.currency("currency")];
    totals.credited = reader.u64("credited");
    totals.withdrawn = reader.u64("withdrawn");
  } else if (table == "nonce") {
    tables.nonces[reader.text("subject")] = reader.u64("value");
  } else if (table == "limit") {
    tables.limits[reader.currency("currency")] = PaymentLimits{
        .min_payment = reader.u64("min_payment"),
        .max_payment = reader.u64("max_payment"),
        .verified_max_payment = reader.u64("verified_max_payment"),
    };
  } else if (table == "verified") {
    tables.verified.insert(reader.text("identity"));
  } else if (table == "cooldown") {
    tables.last_payment_unix[reader.text("payer")] = reader.i64("unix");
  } else if (table == "nft") {
    NftRecord nft;
    nft.token_id = reader.u64("token_id");
    nft.owner = reader.text("owner");
    nft.uri = reader.text("uri");
    nft.minted_unix = reader.i64("minted_unix");
    tables.nfts[nft.token_id] = std::move(nft);
  } else {
    return Result::failure(ErrorCode::PersistenceFailed,
                           "Snapshot contains unknown table `" + std::string{table} + "`.");
  }

  if (!reader.ok()) {
    return Result::failure(ErrorCode::PersistenceFailed,
                           "Snapshot `" + std::string{table} + "` record is malformed.");
  }
  return Result::success();
}

std::string serialize_tables(const Store::Tables& tables) {
  std::string out{kSnapshotHeader};
  out.push_back('\n');

  out += snapshot_line("settings", {
                                       {"trusted_verifier", tables.settings.trusted_verifier},
                                       {"platform_fee_recipient", tables.settings.platform_fee_recipient},
                                       {"platform_fee_percent", std::to_string(tables.settings.platform_fee_percent)},
                                       {"nft_base_uri", tables.settings.nft_base_uri},
                                       {"paused", tables.settings.paused ? "1" : "0"},
                                       {"next_nft_id", std::to_string(tables.next_nft_id)},
                                   });

  for (const auto& [event_id, event] : tables.events) {
    out += snapshot_line("event", {
                                      {"event_id", event_id},
                                      {"name", event.name},
                                      {"description", event.description},
                                      {"start_unix", std::to_string(event.start_unix)},
                                      {"end_unix", std::to_string(event.end_unix)},
                                      {"organizer", event.organizer},
                                      {"status", event_status_name(event.status)},
                                      {"currency", currency_name(event.currency)},
                                      {"commission_percent", std::to_string(event.commission_percent)},
                                      {"commission_recipient", event.commission_recipient},
                                      {"tier_ids", util::join_csv(event.tier_ids)},
                                      {"created_unix", std::to_string(event.created_unix)},
                                  });
  }
  for (const auto& [key, tier] : tables.tiers) {
    out += snapshot_line("tier", {
                                     {"event_id", key.first},
                                     {"tier_id", key.second},
                                     {"price", std::to_string(tier.price)},
                                     {"max_quantity", std::to_string(tier.max_quantity)},
                                     {"sold_count", std::to_string(tier.sold_count)},
                                     {"active", tier.active ? "1" : "0"},
                                 });
  }
  for (const auto& [key, quantity] : tables.tickets) {
    out += snapshot_line("ticket", {
                                       {"owner", key.first},
                                       {"token_id", key.second},
                                       {"quantity", std::to_string(quantity)},
                                   });
  }
  for (const auto& [key, amount] : tables.balances) {
    out += snapshot_line("balance", {
                                        {"owner", key.first},
                                        {"currency", currency_name(key.second)},
                                        {"amount", std::to_string(amount)},
                                    });
  }
  for (const auto& [currency, totals] : tables.totals) {
    out += snapshot_line("total", {
                                      {"currency", currency_name(currency)},
                                      {"credited", std::to_string(totals.credited)},
                                      {"withdrawn", std::to_string(totals.withdrawn)},
                                  });
  }
  for (const auto& [subject, value] : tables.nonces) {
    out += snapshot_line("nonce", {{"subject", subject}, {"value", std::to_string(value)}});
  }
  for (const auto& [currency, limits] : tables.limits) {
    out += snapshot_line("limit", {
                                      {"currency", currency_name(currency)},
                                      {"min_payment", std::to_string(limits.min_payment)},
                                      {"max_payment", std::to_string(limits.max_payment)},
                                      {"verified_max_payment", std::to_string(limits.verified_max_payment)},
                                  });
  }
  for (const auto& identity : tables.verified) {
    out += snapshot_line("verified", {{"identity", identity}});
  }
  for (const auto& [payer, unix_ts] : tables.last_payment_unix) {
    out += snapshot_line("cooldown", {{"payer", payer}, {"unix", std::to_string(unix_ts)}});
  }
  for (const auto& [token_id, nft] : tables.nfts) {
    out += snapshot_line("nft", {
                                    {"token_id", std::to_string(token_id)},
                                    {"owner", nft.owner},
                                    {"uri", nft.uri},
                                    {"minted_unix", std::to_string(nft.minted_unix)},
                                });
  }
  return out;
}

}  // namespace

Store::Transaction::Transaction(Store& store) : store_(store) {
  active_ = store_.begin_transaction().ok;
}

Store::Transaction::~Transaction() {
  rollback();
}

Result Store::Transaction::commit() {
  if (!active_) {
    return Result::failure(ErrorCode::PersistenceFailed, "Transaction is not active.");
  }
  active_ = false;
  return store_.commit_transaction();
}

void Store::Transaction::rollback() {
  if (!active_) {
    return;
  }
  active_ = false;
  store_.rollback_transaction();
}

Result Store::open(std::string_view data_dir, bool enable_snapshots) {
  data_dir_ = std::string{data_dir};
  enable_snapshots_ = enable_snapshots;
  restored_from_snapshot_ = false;
  tables_ = Tables{};
  backup_.reset();
  pending_audit_.clear();
  audit_records_.clear();
  rejected_request_count_ = 0;

  if (data_dir_.empty()) {
    snapshot_path_.clear();
    audit_log_path_.clear();
    rejected_log_path_.clear();
    return Result::success("Store opened in memory.");
  }

  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    return Result::failure(ErrorCode::PersistenceFailed, "Failed to create store directory: " + ec.message());
  }

  const std::filesystem::path root{data_dir_};
  snapshot_path_ = (root / std::string{kSnapshotFile}).string();
  audit_log_path_ = (root / std::string{kAuditLogFile}).string();
  rejected_log_path_ = (root / std::string{kRejectedLogFile}).string();

  const Result audit_result = load_audit_log();
  if (!audit_result.ok) {
    return audit_result;
  }
  if (enable_snapshots_) {
    const Result snapshot_result = load_snapshot();
    if (!snapshot_result.ok) {
      return snapshot_result;
    }
  }
  return Result::success(restored_from_snapshot_ ? "Store restored from snapshot." : "Store opened.");
}

void Store::stage_audit(std::string_view kind, std::string_view actor, std::int64_t unix_ts,
                        std::vector<std::pair<std::string, std::string>> payload_fields) {
  AuditRecord record;
  record.kind = std::string{kind};
  record.actor = std::string{actor};
  record.unix_ts = unix_ts;
  record.payload = util::canonical_join(std::move(payload_fields));
  const std::size_t sequence = audit_records_.size() + pending_audit_.size();
  record.record_id = "aud-" + util::sha256_hex(std::to_string(sequence) + "|" + record.kind + "|" +
                                               record.actor + "|" + std::to_string(unix_ts) + "|" +
                                               record.payload)
                                  .substr(0, 24);

  if (in_transaction()) {
    pending_audit_.push_back(std::move(record));
    return;
  }
  const Result appended = append_audit_log({record});
  if (!appended.ok) {
    record_rejection("audit", appended);
  }
  audit_records_.push_back(std::move(record));
}

void Store::record_rejection(std::string_view operation, const Result& result) {
  ++rejected_request_count_;
  if (rejected_log_path_.empty()) {
    return;
  }

  std::ofstream out(rejected_log_path_, std::ios::out | std::ios::app);
  if (!out) {
    return;
  }
  out << util::unix_timestamp_now() << '\t' << operation << '\t' << error_code_name(result.code) << '\t'
      << result.message << '\n';
}

Result Store::begin_transaction() {
  if (backup_.has_value()) {
    return Result::failure(ErrorCode::ReentrantCall, "A store transaction is already open.");
  }
  backup_ = tables_;
  pending_audit_.clear();
  return Result::success();
}

Result Store::commit_transaction() {
  if (!backup_.has_value()) {
    return Result::failure(ErrorCode::PersistenceFailed, "No store transaction is open.");
  }

  const Result snapshot = persist_snapshot();
  if (!snapshot.ok) {
    rollback_transaction();
    return snapshot;
  }

  const Result appended = append_audit_log(pending_audit_);
  if (!appended.ok) {
    rollback_transaction();
    const Result restored = persist_snapshot();
    if (!restored.ok) {
      return Result::failure(ErrorCode::PersistenceFailed, appended.message + " " + restored.message);
    }
    return appended;
  }

  for (auto& record : pending_audit_) {
    audit_records_.push_back(std::move(record));
  }
  pending_audit_.clear();
  backup_.reset();
  return Result::success();
}

void Store::rollback_transaction() {
  if (!backup_.has_value()) {
    return;
  }
  tables_ = std::move(*backup_);
  backup_.reset();
  pending_audit_.clear();
}

Result Store::load_snapshot() {
  std::ifstream in(snapshot_path_);
  if (!in) {
    return Result::success("Snapshot will be created on first commit.");
  }

  Tables loaded;
  std::string line;
  bool header_seen = false;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    if (line.front() == '#') {
      header_seen = header_seen || line == kSnapshotHeader;
      continue;
    }

    const auto split = line.find('\t');
    if (split == std::string::npos) {
      return Result::failure(ErrorCode::PersistenceFailed, "Snapshot line is missing a table tag.");
    }
    const std::string payload = util::from_hex(std::string_view{line}.substr(split + 1U));
    FieldReader reader{util::parse_canonical_map(payload)};
    const Result applied = apply_snapshot_record(std::string_view{line}.substr(0, split), reader, loaded);
    if (!applied.ok) {
      return applied;
    }
  }

  if (!header_seen) {
    return Result::failure(ErrorCode::PersistenceFailed, "Snapshot header is missing or unsupported.");
  }
  tables_ = std::move(loaded);
  restored_from_snapshot_ = true;
  return Result::success("Snapshot loaded.");
}

Result Store::persist_snapshot() const {
  if (!enable_snapshots_ || snapshot_path_.empty()) {
    return Result::success("Snapshots disabled.");
  }

  const std::string temp_path = snapshot_path_ + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      return Result::failure(ErrorCode::PersistenceFailed, "Failed to write snapshot file.");
    }
    out << serialize_tables(tables_);
    if (!out.good()) {
      return Result::failure(ErrorCode::PersistenceFailed, "Failed flushing snapshot file.");
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, snapshot_path_, ec);
  if (ec) {
    return Result::failure(ErrorCode::PersistenceFailed, "Failed to replace snapshot file: " + ec.message());
  }
  return Result::success("Snapshot persisted.");
}

Result Store::load_audit_log() {
  audit_records_.clear();

  std::ifstream in(audit_log_path_);
  if (!in) {
    return Result::success("Audit log will be created on first write.");
  }

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }
    AuditRecord record;
    if (!parse_audit_line(line, record)) {
      return Result::failure(ErrorCode::PersistenceFailed, "Audit log contains a malformed line.");
    }
    audit_records_.push_back(std::move(record));
  }
  return Result::success();
}

Result Store::append_audit_log(const std::vector<AuditRecord>& records) const {
  if (audit_log_path_.empty() || records.empty()) {
    return Result::success();
  }

  std::string buffer;
  for (const auto& record : records) {
    buffer += serialize_audit_line(record);
  }

  std::ofstream out(audit_log_path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure(ErrorCode::PersistenceFailed, "Failed to write audit log file.");
  }
  out << buffer;
  if (!out.good()) {
    return Result::failure(ErrorCode::PersistenceFailed, "Failed to flush audit log file.");
  }
  return Result::success();
}

}  // namespace craftiax
