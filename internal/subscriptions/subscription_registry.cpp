#include "subscription_registry.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <unordered_set>

#include "internal/events/event_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/subscriptions/pattern_matcher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace reactor::subscriptions {

using reactor::v1::Subscription;
using reactor::v1::SubscriptionPattern;

namespace {

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw util::PersistenceError(prefix + ": " + result.Describe());
  }
}

std::string EncodePattern(const SubscriptionPattern& pattern) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(pattern, &json);
  if (!status.ok()) {
    throw util::PersistenceError("encode subscription pattern: " + std::string(status.message()));
  }
  return json;
}

Subscription Decode(const db::model::SubscriptionRecord& record) {
  Subscription subscription;
  subscription.set_id(record.id);
  subscription.set_agent_id(record.agent_id);
  subscription.set_is_default(record.is_default);
  *subscription.mutable_created_at() = util::TimestampFromMillis(record.created_at_ms);
  *subscription.mutable_updated_at() = util::TimestampFromMillis(record.updated_at_ms);

  auto status = google::protobuf::util::JsonStringToMessage(record.pattern_json, subscription.mutable_pattern());
  if (!status.ok()) {
    throw util::PersistenceError("decode subscription " + std::to_string(record.id) + ": " + std::string(status.message()));
  }
  return subscription;
}

bool SamePattern(const SubscriptionPattern& a, const SubscriptionPattern& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

} // namespace

SubscriptionRegistry::SubscriptionRegistry(std::shared_ptr<db::SubscriptionRepository> repository) : repository_(std::move(repository)) {
}

SubscriptionPattern SubscriptionRegistry::DirectMessagePattern(const std::string& agent_id) {
  SubscriptionPattern pattern;
  pattern.set_to_agent(agent_id);
  return pattern;
}

SubscriptionPattern SubscriptionRegistry::FileChangePattern(const std::string& file_path) {
  SubscriptionPattern pattern;
  pattern.mutable_event_types()->add_values(std::string(events::EventTypeName(reactor::v1::Event::kContentChanged)));
  pattern.set_path_glob(file_path);
  return pattern;
}

Subscription SubscriptionRegistry::Register(const std::string& agent_id, const SubscriptionPattern& pattern, bool is_default) {
  if (agent_id.empty()) {
    throw util::InvalidArgument("register subscription: agent_id is empty");
  }
  if (!HasAnyField(pattern)) {
    throw util::InvalidArgument("register subscription: pattern for " + agent_id + " has no fields; it would match every event");
  }

  db::model::SubscriptionRecord record;
  record.agent_id      = agent_id;
  record.pattern_json  = EncodePattern(pattern);
  record.is_default    = is_default;
  record.created_at_ms = util::NowMillis();
  record.updated_at_ms = record.created_at_ms;

  {
    std::lock_guard lock(write_mutex_);
    auto            tx = repository_->Begin();
    ThrowIfError(repository_->InsertSubscription(*tx, record), "register subscription");
    tx->Commit();
    tx.reset();
    Invalidate();
  }

  return Decode(record);
}

std::vector<Subscription> SubscriptionRegistry::RegisterDefaults(const std::string& agent_id, const std::string& file_path) {
  if (agent_id.empty()) {
    throw util::InvalidArgument("register defaults: agent_id is empty");
  }

  std::vector<SubscriptionPattern> desired = {DirectMessagePattern(agent_id)};
  if (!file_path.empty()) desired.push_back(FileChangePattern(file_path));

  std::lock_guard lock(write_mutex_);
  auto            tx = repository_->Begin();

  std::vector<Subscription> existing;
  for (const auto& record : repository_->ListSubscriptions(*tx, agent_id)) {
    if (record.is_default) existing.push_back(Decode(record));
  }

  const bool up_to_date =
      existing.size() == desired.size() &&
      std::equal(existing.begin(), existing.end(), desired.begin(), [](const Subscription& s, const SubscriptionPattern& p) { return SamePattern(s.pattern(), p); });
  if (up_to_date) {
    return existing;
  }

  uint64_t removed = 0;
  ThrowIfError(repository_->DeleteAgentSubscriptions(*tx, agent_id, true, removed), "replace default subscriptions");

  const auto                now = util::NowMillis();
  std::vector<Subscription> created;
  for (const auto& pattern : desired) {
    db::model::SubscriptionRecord record;
    record.agent_id      = agent_id;
    record.pattern_json  = EncodePattern(pattern);
    record.is_default    = true;
    record.created_at_ms = now;
    record.updated_at_ms = now;
    ThrowIfError(repository_->InsertSubscription(*tx, record), "register default subscription");
    created.push_back(Decode(record));
  }
  tx->Commit();
  tx.reset();
  Invalidate();

  if (removed > 0) {
    REACTOR_LOG_INFO("default subscriptions replaced", {observability::StringField("agent_id", agent_id), observability::StringField("file_path", file_path),
                                                        observability::UIntField("removed", removed)});
  }
  return created;
}

bool SubscriptionRegistry::Unregister(uint64_t subscription_id) {
  std::lock_guard lock(write_mutex_);
  auto            tx     = repository_->Begin();
  auto            result = repository_->DeleteSubscription(*tx, subscription_id);
  if (result.code == db::ErrorCode::NotFound) {
    return false;
  }
  ThrowIfError(result, "unregister subscription");
  tx->Commit();
  tx.reset();
  Invalidate();
  return true;
}

uint64_t SubscriptionRegistry::UnregisterAll(const std::string& agent_id) {
  std::lock_guard lock(write_mutex_);
  auto            tx      = repository_->Begin();
  uint64_t        removed = 0;
  ThrowIfError(repository_->DeleteAgentSubscriptions(*tx, agent_id, false, removed), "unregister agent subscriptions");
  tx->Commit();
  tx.reset();
  Invalidate();
  return removed;
}

std::vector<Subscription> SubscriptionRegistry::GetSubscriptions(const std::string& agent_id) const {
  auto tx = repository_->Begin();

  std::vector<Subscription> out;
  for (const auto& record : repository_->ListSubscriptions(*tx, agent_id)) out.push_back(Decode(record));
  return out;
}

std::optional<Subscription> SubscriptionRegistry::GetSubscription(uint64_t subscription_id) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetSubscription(*tx, subscription_id);
  if (!record) return std::nullopt;
  return Decode(*record);
}

std::vector<std::string> SubscriptionRegistry::GetMatchingAgents(const reactor::v1::Event& event) const {
  auto snapshot = LoadSnapshot();

  std::vector<std::string>        agents;
  std::unordered_set<std::string> seen;
  for (const auto& subscription : *snapshot) {
    if (seen.count(subscription.agent_id()) > 0) continue;
    if (Matches(subscription.pattern(), event)) {
      seen.insert(subscription.agent_id());
      agents.push_back(subscription.agent_id());
    }
  }
  return agents;
}

std::shared_ptr<const SubscriptionRegistry::Snapshot> SubscriptionRegistry::LoadSnapshot() const {
  std::lock_guard lock(cache_mutex_);
  if (cache_) return cache_;

  auto tx       = repository_->Begin();
  auto snapshot = std::make_shared<Snapshot>();
  for (const auto& record : repository_->ListSubscriptions(*tx, std::nullopt)) snapshot->push_back(Decode(record));

  cache_ = std::move(snapshot);
  return cache_;
}

void SubscriptionRegistry::Invalidate() {
  std::lock_guard lock(cache_mutex_);
  cache_.reset();
}

} // namespace reactor::subscriptions
