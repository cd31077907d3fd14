#include "lancet/trust/redis_trust_state_store.h"

#include <nlohmann/json.hpp>

#include <iterator>
#include <set>
#include <stdexcept>
#include <sw/redis++/redis++.h>
#include <unordered_map>

namespace lancet::trust {

namespace {

// Shared helpers prepended to every mutating script.
// KEYS: domain_key, claims_key, domains_key, blocked_key, notify_key, notify_domains_key
constexpr const char* kScriptPrelude = R"LUA(
local dk, ck, domains, blocked, nq, nqd = KEYS[1], KEYS[2], KEYS[3], KEYS[4], KEYS[5], KEYS[6]

local function ensure_state(domain, baseline, now)
  redis.call('SADD', domains, domain)
  if redis.call('EXISTS', dk) == 0 then
    redis.call('HSET', dk, 'domain', domain, 'trust_level', baseline, 'is_blocked', '0',
               'last_updated', now, 'n_verified', 0, 'n_security_rejected', 0,
               'n_manual_rejected', 0, 'n_pending', 0)
  end
end

local function rejection_rate()
  local v = tonumber(redis.call('HGET', dk, 'n_verified') or '0')
  local s = tonumber(redis.call('HGET', dk, 'n_security_rejected') or '0')
  local m = tonumber(redis.call('HGET', dk, 'n_manual_rejected') or '0')
  local p = tonumber(redis.call('HGET', dk, 'n_pending') or '0')
  local total = v + s + m + p
  if total == 0 then
    return 0, 0
  end
  return (s + m) / total, total
end

local function enqueue(domain, reason, task_id, cause_id)
  if redis.call('SADD', nqd, domain) == 1 then
    redis.call('RPUSH', nq, cjson.encode({domain = domain, reason = reason,
                                          task_id = task_id, cause_id = cause_id}))
    return '1'
  end
  return '0'
end

local function mark_blocked(domain, code, reason, cause_id, now)
  local level = redis.call('HGET', dk, 'trust_level')
  redis.call('HSET', dk, 'original_trust_level', level, 'trust_level', 'blocked',
             'is_blocked', '1', 'blocked_at', now, 'block_reason', reason,
             'block_reason_code', code, 'block_cause_id', cause_id, 'last_updated', now)
  redis.call('SADD', blocked, domain)
end
)LUA";

// ARGV: domain, claim_id, bucket, baseline, promote, block, block_code, block_reason,
//       cause_id, task_id, max_rate, now, claim_cause_id
// Returns: { rejected_as_blocked, before, after, auto_blocked, rejection_rate, queued }
constexpr const char* kApplyScript = R"LUA(
local domain, claim, bucket, baseline = ARGV[1], ARGV[2], ARGV[3], ARGV[4]
local promote, block, code, reason = ARGV[5], ARGV[6], ARGV[7], ARGV[8]
local cause_id, task_id, max_rate, now = ARGV[9], ARGV[10], tonumber(ARGV[11]), ARGV[12]
local claim_cause_id = ARGV[13]

ensure_state(domain, baseline, now)
local before = redis.call('HGET', dk, 'trust_level')

if redis.call('HGET', dk, 'is_blocked') == '1' then
  local rate = rejection_rate()
  return {'1', before, 'blocked', '0', tostring(rate), '0'}
end

local prev = redis.call('HGET', ck, claim)
if prev then
  redis.call('HINCRBY', dk, 'n_' .. prev, -1)
end
redis.call('HSET', ck, claim, bucket)
redis.call('HINCRBY', dk, 'n_' .. bucket, 1)
redis.call('HSET', dk, 'last_updated', now)

local rate, total = rejection_rate()

if block == '1' then
  mark_blocked(domain, code, reason, cause_id, now)
  local queued = enqueue(domain, reason, task_id, cause_id)
  return {'0', before, 'blocked', '0', tostring(rate), queued}
end

if promote == '1' and before == 'unverified' then
  redis.call('HSET', dk, 'trust_level', 'low')
end

local auto_blocked, queued = '0', '0'
local rejection = bucket == 'security_rejected' or bucket == 'manual_rejected'
local eligible = before == 'unverified' or before == 'low'
if rejection and eligible and total > 0 and rate > max_rate then
  local why = 'High rejection rate (' .. string.format('%d', math.floor(rate * 100 + 0.5)) .. '%)'
  mark_blocked(domain, 'high_rejection_rate', why, claim_cause_id, now)
  auto_blocked = '1'
  queued = enqueue(domain, why, '', claim_cause_id)
end

return {'0', before, redis.call('HGET', dk, 'trust_level'), auto_blocked, tostring(rate), queued}
)LUA";

// ARGV: domain, baseline, code, reason, cause_id, task_id, now
constexpr const char* kBlockScript = R"LUA(
local domain, baseline, code, reason = ARGV[1], ARGV[2], ARGV[3], ARGV[4]
local cause_id, task_id, now = ARGV[5], ARGV[6], ARGV[7]

ensure_state(domain, baseline, now)
if redis.call('HGET', dk, 'is_blocked') == '1' then
  return '0'
end
mark_blocked(domain, code, reason, cause_id, now)
enqueue(domain, reason, task_id, cause_id)
return '1'
)LUA";

// ARGV: domain, now. Returns the restored level, or '' when the domain was not blocked.
constexpr const char* kUnblockScript = R"LUA(
local domain, now = ARGV[1], ARGV[2]

if redis.call('SREM', blocked, domain) == 0 then
  return ''
end
if redis.call('EXISTS', dk) == 0 then
  return 'unverified'
end
local restored = redis.call('HGET', dk, 'original_trust_level') or 'unverified'
redis.call('HSET', dk, 'trust_level', restored, 'is_blocked', '0', 'last_updated', now)
return restored
)LUA";

// Snapshot-then-clear of the notification queue.
constexpr const char* kDrainScript = R"LUA(
local items = redis.call('LRANGE', nq, 0, -1)
redis.call('DEL', nq, nqd)
return items
)LUA";

TrustLevel level_or(const std::string& value, const TrustLevel fallback) {
  return parse_trust_level(value).value_or(fallback);
}

std::string field(const std::unordered_map<std::string, std::string>& map,
                  const std::string& name) {
  const auto it = map.find(name);
  return it == map.end() ? std::string{} : it->second;
}

}  // namespace

RedisTrustStateStore::RedisTrustStateStore(const RedisConfig& config, std::string key_prefix)
    : prefix_(std::move(key_prefix)) {
  try {
    sw::redis::ConnectionOptions options;
    options.host = config.host;
    options.port = config.port;
    options.db = config.redis_db;
    redis_ = std::make_unique<sw::redis::Redis>(options);
    redis_->ping();
    load_scripts();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisTrustStateStore::~RedisTrustStateStore() = default;

void RedisTrustStateStore::load_scripts() {
  const std::string prelude{kScriptPrelude};
  apply_script_sha_ = redis_->script_load(prelude + kApplyScript);
  block_script_sha_ = redis_->script_load(prelude + kBlockScript);
  unblock_script_sha_ = redis_->script_load(prelude + kUnblockScript);
  drain_script_sha_ = redis_->script_load(prelude + kDrainScript);
}

std::string RedisTrustStateStore::key(const std::string& suffix) const {
  return prefix_ + ":" + suffix;
}

std::string RedisTrustStateStore::domain_key(const std::string& domain) const {
  return key("domain:" + domain);
}

std::string RedisTrustStateStore::claims_key(const std::string& domain) const {
  return key("domain:" + domain + ":claims");
}

TransitionApplied RedisTrustStateStore::apply_claim_transition(const ClaimTransition& transition) {
  const std::vector<std::string> keys = {domain_key(transition.domain),
                                         claims_key(transition.domain),
                                         key("domains"),
                                         key("blocked"),
                                         key("notify"),
                                         key("notify:domains")};
  const BlockRequest block = transition.block.value_or(BlockRequest{});
  const std::vector<std::string> args = {transition.domain,
                                         transition.claim_id,
                                         to_string(transition.bucket),
                                         to_string(transition.baseline_trust),
                                         transition.promote_if_unverified ? "1" : "0",
                                         transition.block.has_value() ? "1" : "0",
                                         to_string(block.code),
                                         block.reason,
                                         block.cause_id,
                                         block.task_id,
                                         std::to_string(transition.max_rejection_rate),
                                         transition.updated_at,
                                         transition.cause_id};

  sw::redis::StringView script_sha{apply_script_sha_};
  const auto reply = redis_->evalsha<std::vector<std::string>>(
      script_sha, keys.begin(), keys.end(), args.begin(), args.end());
  if (reply.size() != 6) {
    throw std::runtime_error("Unexpected reply from trust transition script");
  }

  TransitionApplied applied;
  applied.rejected_as_blocked = reply[0] == "1";
  applied.before = level_or(reply[1], TrustLevel::kUnverified);
  applied.after = level_or(reply[2], TrustLevel::kUnverified);
  applied.auto_blocked = reply[3] == "1";
  applied.rejection_rate = std::stod(reply[4]);
  applied.notification_queued = reply[5] == "1";
  return applied;
}

bool RedisTrustStateStore::block_domain(const std::string& domain, const BlockRequest& request,
                                        const TrustLevel baseline_trust,
                                        const std::string& updated_at) {
  const std::vector<std::string> keys = {domain_key(domain), claims_key(domain),
                                         key("domains"),     key("blocked"),
                                         key("notify"),      key("notify:domains")};
  const std::vector<std::string> args = {domain,           to_string(baseline_trust),
                                         to_string(request.code), request.reason,
                                         request.cause_id, request.task_id,
                                         updated_at};

  sw::redis::StringView script_sha{block_script_sha_};
  const auto reply = redis_->evalsha<std::string>(script_sha, keys.begin(), keys.end(),
                                                  args.begin(), args.end());
  return reply == "1";
}

std::optional<TrustLevel> RedisTrustStateStore::unblock_domain(const std::string& domain,
                                                               const std::string& updated_at) {
  const std::vector<std::string> keys = {domain_key(domain), claims_key(domain),
                                         key("domains"),     key("blocked"),
                                         key("notify"),      key("notify:domains")};
  const std::vector<std::string> args = {domain, updated_at};

  sw::redis::StringView script_sha{unblock_script_sha_};
  const auto reply = redis_->evalsha<std::string>(script_sha, keys.begin(), keys.end(),
                                                  args.begin(), args.end());
  if (reply.empty()) {
    return std::nullopt;
  }
  return level_or(reply, TrustLevel::kUnverified);
}

bool RedisTrustStateStore::is_blocked(const std::string& domain) const {
  return redis_->sismember(key("blocked"), domain);
}

std::optional<DomainVerificationState> RedisTrustStateStore::get_domain_state(
    const std::string& domain) const {
  std::unordered_map<std::string, std::string> fields;
  redis_->hgetall(domain_key(domain), std::inserter(fields, fields.end()));
  if (fields.empty()) {
    return std::nullopt;
  }

  DomainVerificationState state;
  state.domain = domain;
  state.trust_level = level_or(field(fields, "trust_level"), TrustLevel::kUnverified);
  state.last_updated = field(fields, "last_updated");
  state.is_blocked = field(fields, "is_blocked") == "1";
  state.blocked_at = field(fields, "blocked_at");
  state.block_reason = field(fields, "block_reason");
  state.block_reason_code = parse_block_reason(field(fields, "block_reason_code"));
  state.block_cause_id = field(fields, "block_cause_id");
  state.original_trust_level = parse_trust_level(field(fields, "original_trust_level"));

  std::unordered_map<std::string, std::string> claims;
  redis_->hgetall(claims_key(domain), std::inserter(claims, claims.end()));
  for (const auto& [claim_id, bucket_name] : claims) {
    if (const auto bucket = parse_claim_bucket(bucket_name)) {
      state.place(claim_id, *bucket);
    }
  }
  return state;
}

std::vector<DomainVerificationState> RedisTrustStateStore::all_domain_states() const {
  std::set<std::string> domains;
  redis_->smembers(key("domains"), std::inserter(domains, domains.end()));

  std::vector<DomainVerificationState> out;
  for (const auto& domain : domains) {
    if (auto state = get_domain_state(domain)) {
      out.push_back(std::move(*state));
    }
  }
  return out;
}

std::vector<std::string> RedisTrustStateStore::blocked_domains() const {
  std::set<std::string> domains;
  redis_->smembers(key("blocked"), std::inserter(domains, domains.end()));
  return {domains.begin(), domains.end()};
}

std::vector<BlockedDomainNotification> RedisTrustStateStore::drain_notifications() {
  const std::vector<std::string> keys = {key("unused:domain"), key("unused:claims"),
                                         key("domains"),       key("blocked"),
                                         key("notify"),        key("notify:domains")};
  const std::vector<std::string> args;

  sw::redis::StringView script_sha{drain_script_sha_};
  const auto items = redis_->evalsha<std::vector<std::string>>(
      script_sha, keys.begin(), keys.end(), args.begin(), args.end());

  std::vector<BlockedDomainNotification> out;
  out.reserve(items.size());
  for (const auto& item : items) {
    const auto parsed = nlohmann::json::parse(item, nullptr, false);
    if (auto notification = notification_from_json(parsed)) {
      out.push_back(std::move(*notification));
    }
  }
  return out;
}

std::size_t RedisTrustStateStore::pending_notification_count() const {
  return static_cast<std::size_t>(redis_->llen(key("notify")));
}

void RedisTrustStateStore::reset() {
  std::set<std::string> domains;
  redis_->smembers(key("domains"), std::inserter(domains, domains.end()));

  std::vector<std::string> doomed = {key("domains"), key("blocked"), key("notify"),
                                     key("notify:domains")};
  for (const auto& domain : domains) {
    doomed.push_back(domain_key(domain));
    doomed.push_back(claims_key(domain));
  }
  redis_->del(doomed.begin(), doomed.end());
}

}  // namespace lancet::trust
