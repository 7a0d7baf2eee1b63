/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/impl/sync_manager_impl.hpp"

#include <set>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "audit/audit_storage_error.hpp"
#include "audit/impl/in_memory_audit_storage.hpp"
#include "mock/core/audit/audit_storage_mock.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "sync/sync_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace auditsync;
using namespace sync;
using namespace std::chrono_literals;

using audit::AuditRecord;
using audit::AuditStorageError;
using audit::AuditStorageMock;
using audit::EventType;
using audit::InMemoryAuditStorage;
using clock::SystemClock;
using clock::SystemClockMock;
using primitives::NodeId;
using primitives::toTimestamp;

using testing::NiceMock;
using testing::Return;
using testing::ReturnPointee;

class SyncManagerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(*clock_, now()).WillByDefault(ReturnPointee(&now_));
  }

  /// Replica under test: its log and its sync manager
  struct Node {
    std::shared_ptr<InMemoryAuditStorage> storage;
    std::unique_ptr<SyncManagerImpl> manager;
  };

  Node makeNode(const NodeId &id, SyncConfig config = {}) {
    auto storage = std::make_shared<InMemoryAuditStorage>();
    auto manager =
        std::make_unique<SyncManagerImpl>(id, config, storage, clock_);
    return Node{std::move(storage), std::move(manager)};
  }

  /// Appends records stamped with the given time to the log
  std::vector<primitives::RecordId> appendRecords(
      InMemoryAuditStorage &storage,
      size_t count,
      SystemClock::TimePoint at) {
    std::vector<primitives::RecordId> ids;
    for (size_t i = 0; i < count; ++i) {
      auto record = AuditRecord::create(EventType::AutomaticDecision,
                                        "system:evaluator",
                                        "statute-1",
                                        "subject-" + std::to_string(i),
                                        R"({"eligible":true})",
                                        toTimestamp(at),
                                        std::nullopt);
      EXPECT_OUTCOME_TRUE(id, storage.append(std::move(record)));
      ids.push_back(id);
    }
    return ids;
  }

  /// Stores records of a response the way a replica does after acking it
  void importResponse(InMemoryAuditStorage &storage,
                      const SyncResponse &response) {
    for (const auto &distributed : response.records) {
      if (not storage.contains(distributed.id())) {
        EXPECT_OUTCOME_TRUE_1(storage.importRecord(distributed.record));
      }
    }
  }

  SystemClock::TimePoint now_{std::chrono::hours{24 * 1000}};
  std::shared_ptr<SystemClockMock> clock_ =
      std::make_shared<NiceMock<SystemClockMock>>();

  const NodeId a_{"node-a"};
  const NodeId b_{"node-b"};
};

/**
 * @given manager that never heard of a peer
 * @when it is asked about the peer
 * @then the peer needs a sync and the request looks back 24 hours
 */
TEST_F(SyncManagerTest, UnknownPeerNeedsSync) {
  auto node = makeNode(a_);

  EXPECT_TRUE(node.manager->needsSync(b_));
  EXPECT_FALSE(node.manager->syncState(b_).has_value());

  EXPECT_OUTCOME_TRUE(request, node.manager->createSyncRequest(b_, {}));
  EXPECT_EQ(request.from_node, a_);
  EXPECT_EQ(request.since, toTimestamp(now_ - 24h));
}

/**
 * @given manager
 * @when a request is created for itself or for an empty id
 * @then it is refused
 */
TEST_F(SyncManagerTest, RequestRejectsInvalidTargets) {
  auto node = makeNode(a_);
  EXPECT_EC(node.manager->createSyncRequest(a_, {}), SyncError::SELF_MESSAGE);
  EXPECT_EC(node.manager->createSyncRequest(NodeId{}, {}),
            SyncError::INVALID_NODE_ID);
}

/**
 * @given log with records older and newer than the watermark
 * @when a sync request arrives
 * @then only newer records are returned, oldest first, stamped with a clock
 * incremented once per record, and they wait for an ack
 */
TEST_F(SyncManagerTest, RequestServesRecordsSinceWatermark) {
  auto a = makeNode(a_);
  appendRecords(*a.storage, 1, now_ - 48h);
  auto newer_ids = appendRecords(*a.storage, 1, now_ - 1h);
  auto older_ids = appendRecords(*a.storage, 1, now_ - 2h);

  SyncRequest request{
      .from_node = b_,
      .since = toTimestamp(now_ - 24h),
      .vector_clock = {},
  };
  EXPECT_OUTCOME_TRUE(response,
                      a.manager->processSyncRequest(SyncMessage{request}));

  ASSERT_EQ(response.records.size(), 2);
  EXPECT_FALSE(response.has_more);
  EXPECT_EQ(response.from_node, a_);
  EXPECT_EQ(response.records[0].id(), older_ids[0]);
  EXPECT_EQ(response.records[1].id(), newer_ids[0]);
  EXPECT_EQ(response.records[0].origin_node, a_);
  EXPECT_EQ(response.records[0].vector_clock.get(a_), 1);
  EXPECT_EQ(response.records[1].vector_clock.get(a_), 2);
  EXPECT_EQ(a.manager->localClock().get(a_), 2);
  EXPECT_EQ(response.vector_clock, a.manager->localClock());

  auto state = a.manager->syncState(b_);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->get().pending_records.size(), 2);
  EXPECT_TRUE(a.manager->needsSync(b_));
}

/**
 * @given more matching records than fit into a batch
 * @when the requester processes the truncated response
 * @then has_more is set and the next request continues at the last received
 * record
 */
TEST_F(SyncManagerTest, TruncatedResponseContinuesFromLastRecord) {
  SyncConfig config;
  config.batch_size = 2;
  auto a = makeNode(a_, config);
  auto b = makeNode(b_, config);
  for (int i = 5; i > 0; --i) {
    appendRecords(*a.storage, 1, now_ - std::chrono::minutes{i});
  }

  EXPECT_OUTCOME_TRUE(request, b.manager->createSyncRequest(a_, {}));
  EXPECT_OUTCOME_TRUE(response,
                      a.manager->processSyncRequest(SyncMessage{request}));
  ASSERT_EQ(response.records.size(), 2);
  EXPECT_TRUE(response.has_more);

  EXPECT_OUTCOME_TRUE(ack,
                      b.manager->processSyncResponse(SyncMessage{response}));
  EXPECT_EQ(ack.record_ids.size(), 2);

  auto state = b.manager->syncState(a_);
  ASSERT_TRUE(state.has_value());
  EXPECT_TRUE(state->get().continuation_pending);
  EXPECT_EQ(state->get().last_sync, toTimestamp(now_ - 4min));
  EXPECT_TRUE(b.manager->needsSync(a_));

  EXPECT_OUTCOME_TRUE(next, b.manager->createSyncRequest(a_, {}));
  EXPECT_EQ(next.since, toTimestamp(now_ - 4min));
  EXPECT_OUTCOME_TRUE(rest, a.manager->processSyncRequest(SyncMessage{next}));
  // the boundary record is served again and acknowledged idempotently
  ASSERT_EQ(rest.records.size(), 2);
  EXPECT_TRUE(rest.has_more);
  EXPECT_EQ(rest.records[0].id(), response.records[1].id());
}

/**
 * @given pull-only nodes with a batch size of two and five records stamped
 * within the same millisecond
 * @when the requester keeps requesting and acknowledging while has_more is set
 * @then every record arrives and the continuation ends
 */
TEST_F(SyncManagerTest, SameMillisecondRecordsPageThrough) {
  SyncConfig config;
  config.strategy = SyncStrategy::Pull;
  config.batch_size = 2;
  auto a = makeNode(a_, config);
  auto b = makeNode(b_, config);
  auto ids = appendRecords(*a.storage, 5, now_ - 1h);

  std::set<primitives::RecordId> received;
  size_t rounds = 0;
  bool has_more = true;
  while (has_more and rounds < 5) {
    ++rounds;
    EXPECT_OUTCOME_TRUE(request, b.manager->createSyncRequest(a_, {}));
    EXPECT_OUTCOME_TRUE(response,
                        a.manager->processSyncRequest(SyncMessage{request}));
    EXPECT_OUTCOME_TRUE(ack,
                        b.manager->processSyncResponse(SyncMessage{response}));
    importResponse(*b.storage, response);
    EXPECT_OUTCOME_TRUE_1(a.manager->processSyncAck(SyncMessage{ack}));
    for (const auto &distributed : response.records) {
      received.insert(distributed.id());
    }
    has_more = response.has_more;
  }

  EXPECT_FALSE(has_more);
  EXPECT_EQ(rounds, 3);
  EXPECT_EQ(received, std::set<primitives::RecordId>(ids.begin(), ids.end()));
  EXPECT_OUTCOME_TRUE(b_count, b.storage->count());
  EXPECT_EQ(b_count, 5);
  EXPECT_FALSE(b.manager->syncState(a_)->get().continuation_pending);
  EXPECT_FALSE(b.manager->needsSync(a_));
  EXPECT_FALSE(a.manager->needsSync(b_));
}

/**
 * @given node with an empty log that never heard of a peer
 * @when the peer advertises ten records
 * @then a request from this node looking back 24 hours is produced
 */
TEST_F(SyncManagerTest, HeartbeatFromUnknownPeerPullsLastDay) {
  auto a = makeNode(a_);

  SyncMessage heartbeat{Heartbeat{
      .from_node = b_,
      .vector_clock = {},
      .record_count = 10,
      .last_hash = std::nullopt,
  }};
  EXPECT_OUTCOME_TRUE(reply, a.manager->processHeartbeat(heartbeat));
  ASSERT_TRUE(reply.has_value());
  auto request = if_type<SyncRequest>(*reply);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->get().from_node, a_);
  EXPECT_EQ(request->get().since, toTimestamp(now_ - 24h));
}

/**
 * @given node A holding three records and empty node B
 * @when they exchange heartbeats, request, response and ack
 * @then B ends up with all three records and A has nothing pending for B
 */
TEST_F(SyncManagerTest, HeartbeatDrivenPullReplicatesRecords) {
  auto a = makeNode(a_);
  auto b = makeNode(b_);
  appendRecords(*a.storage, 3, now_ - 1h);

  EXPECT_OUTCOME_TRUE(heartbeat_b, b.manager->createHeartbeat());
  EXPECT_EQ(heartbeat_b.record_count, 0);
  EXPECT_FALSE(heartbeat_b.last_hash.has_value());
  EXPECT_OUTCOME_TRUE(nothing,
                      a.manager->processHeartbeat(SyncMessage{heartbeat_b}));
  EXPECT_FALSE(nothing.has_value());

  EXPECT_OUTCOME_TRUE(heartbeat_a, a.manager->createHeartbeat());
  EXPECT_EQ(heartbeat_a.record_count, 3);
  EXPECT_OUTCOME_TRUE(pull,
                      b.manager->processHeartbeat(SyncMessage{heartbeat_a}));
  ASSERT_TRUE(pull.has_value());
  ASSERT_TRUE(is_type<SyncRequest>(*pull));

  EXPECT_OUTCOME_TRUE(response_msg, a.manager->handleMessage(*pull));
  ASSERT_TRUE(response_msg.has_value());
  auto response = if_type<SyncResponse>(*response_msg);
  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response->get().records.size(), 3);

  EXPECT_OUTCOME_TRUE(ack_msg, b.manager->handleMessage(*response_msg));
  ASSERT_TRUE(ack_msg.has_value());
  importResponse(*b.storage, response->get());
  EXPECT_OUTCOME_TRUE(b_count, b.storage->count());
  EXPECT_EQ(b_count, 3);
  EXPECT_EQ(b.manager->localClock().get(a_), 3);

  EXPECT_OUTCOME_TRUE(reply, a.manager->handleMessage(*ack_msg));
  EXPECT_FALSE(reply.has_value());
  auto a_state = a.manager->syncState(b_);
  ASSERT_TRUE(a_state.has_value());
  EXPECT_FALSE(a_state->get().hasPending());
  EXPECT_EQ(a_state->get().synced_records.size(), 3);
  EXPECT_FALSE(a.manager->needsSync(b_));
  EXPECT_FALSE(b.manager->needsSync(a_));
}

/**
 * @given response already processed once
 * @when the same response arrives again
 * @then no new records are counted and the ack lists the same ids
 */
TEST_F(SyncManagerTest, DuplicateResponseIsHarmless) {
  auto a = makeNode(a_);
  auto b = makeNode(b_);
  appendRecords(*a.storage, 2, now_ - 1h);

  EXPECT_OUTCOME_TRUE(request, b.manager->createSyncRequest(a_, {}));
  EXPECT_OUTCOME_TRUE(response,
                      a.manager->processSyncRequest(SyncMessage{request}));
  SyncMessage message{response};

  EXPECT_OUTCOME_TRUE(first, b.manager->processSyncResponse(message));
  EXPECT_OUTCOME_TRUE(second, b.manager->processSyncResponse(message));
  EXPECT_EQ(first.record_ids, second.record_ids);

  auto state = b.manager->syncState(a_);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->get().synced_records.size(), 2);
}

/**
 * @given records pending for a peer
 * @when the same ack is applied twice
 * @then the state after the second ack equals the state after the first
 */
TEST_F(SyncManagerTest, AckIsIdempotent) {
  auto a = makeNode(a_);
  auto b = makeNode(b_);
  appendRecords(*a.storage, 2, now_ - 1h);

  EXPECT_OUTCOME_TRUE(request, b.manager->createSyncRequest(a_, {}));
  EXPECT_OUTCOME_TRUE(response,
                      a.manager->processSyncRequest(SyncMessage{request}));
  EXPECT_OUTCOME_TRUE(ack,
                      b.manager->processSyncResponse(SyncMessage{response}));

  EXPECT_OUTCOME_TRUE_1(a.manager->processSyncAck(SyncMessage{ack}));
  auto first = a.manager->syncState(b_)->get();
  EXPECT_OUTCOME_TRUE_1(a.manager->processSyncAck(SyncMessage{ack}));
  auto second = a.manager->syncState(b_)->get();

  EXPECT_EQ(first.synced_records, second.synced_records);
  EXPECT_EQ(first.pending_records, second.pending_records);
  EXPECT_EQ(first.failed_attempts, second.failed_attempts);
  EXPECT_TRUE(second.pending_records.empty());
}

/**
 * @given heartbeats advertising fewer, as many and more records than stored
 * locally
 * @when they are processed
 * @then only the last one produces a pull, and every one refreshes last_sync
 */
TEST_F(SyncManagerTest, HeartbeatRequestsOnlyWhenPeerIsAhead) {
  auto a = makeNode(a_);
  appendRecords(*a.storage, 2, now_ - 1h);

  auto heartbeat = [&](uint64_t count) {
    return SyncMessage{Heartbeat{
        .from_node = b_,
        .vector_clock = {},
        .record_count = count,
        .last_hash = std::nullopt,
    }};
  };

  EXPECT_OUTCOME_TRUE(behind, a.manager->processHeartbeat(heartbeat(1)));
  EXPECT_FALSE(behind.has_value());
  EXPECT_EQ(a.manager->syncState(b_)->get().last_sync, toTimestamp(now_));

  EXPECT_OUTCOME_TRUE(equal, a.manager->processHeartbeat(heartbeat(2)));
  EXPECT_FALSE(equal.has_value());

  now_ += 10s;
  EXPECT_OUTCOME_TRUE(ahead, a.manager->processHeartbeat(heartbeat(3)));
  ASSERT_TRUE(ahead.has_value());
  auto request = if_type<SyncRequest>(*ahead);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->get().from_node, a_);
  // watermark from before this heartbeat
  EXPECT_EQ(request->get().since, toTimestamp(now_ - 10s));
  EXPECT_EQ(a.manager->syncState(b_)->get().last_sync, toTimestamp(now_));
}

/**
 * @given peer advertising as many records as stored locally, with another
 * head
 * @when the heartbeat is processed
 * @then the peer is flagged diverged and no request is produced until a
 * successful exchange
 */
TEST_F(SyncManagerTest, DivergedHeadIsFlaggedNotResolved) {
  auto a = makeNode(a_);
  auto b = makeNode(b_);
  appendRecords(*a.storage, 1, now_ - 1h);

  SyncMessage heartbeat{Heartbeat{
      .from_node = b_,
      .vector_clock = {},
      .record_count = 1,
      .last_hash = std::string(64, 'f'),
  }};
  EXPECT_OUTCOME_TRUE(reply, a.manager->processHeartbeat(heartbeat));
  EXPECT_FALSE(reply.has_value());
  EXPECT_TRUE(a.manager->syncState(b_)->get().diverged);

  appendRecords(*b.storage, 1, now_ - 1h);
  EXPECT_OUTCOME_TRUE(request, a.manager->createSyncRequest(b_, {}));
  EXPECT_OUTCOME_TRUE(response,
                      b.manager->processSyncRequest(SyncMessage{request}));
  EXPECT_OUTCOME_TRUE_1(
      a.manager->processSyncResponse(SyncMessage{response}));
  EXPECT_FALSE(a.manager->syncState(b_)->get().diverged);
}

/**
 * @given peer with five failed exchanges and max_retries of three
 * @when the retry delay is queried and an ack finally arrives
 * @then the delay doubles past the retry limit and the ack clears failures
 */
TEST_F(SyncManagerTest, FailuresBackOffUntilSuccess) {
  SyncConfig config;
  config.sync_interval_secs = 60;
  config.max_retries = 3;
  auto a = makeNode(a_, config);

  for (int i = 0; i < 3; ++i) {
    a.manager->recordFailure(b_);
  }
  EXPECT_EQ(a.manager->retryDelay(b_), 60s);
  a.manager->recordFailure(b_);
  a.manager->recordFailure(b_);
  EXPECT_EQ(a.manager->syncState(b_)->get().failed_attempts, 5);
  EXPECT_EQ(a.manager->retryDelay(b_), 240s);

  EXPECT_FALSE(a.manager->canAttempt(b_));
  now_ += 239s;
  EXPECT_FALSE(a.manager->canAttempt(b_));
  now_ += 1s;
  EXPECT_TRUE(a.manager->canAttempt(b_));

  SyncMessage ack{SyncAck{
      .from_node = b_,
      .record_ids = {},
      .vector_clock = {},
  }};
  EXPECT_OUTCOME_TRUE_1(a.manager->processSyncAck(ack));
  EXPECT_EQ(a.manager->syncState(b_)->get().failed_attempts, 0);
  EXPECT_EQ(a.manager->retryDelay(b_), 0s);
  EXPECT_TRUE(a.manager->canAttempt(b_));
}

/**
 * @given peer with five failed exchanges and three records sent to it
 * @when it acknowledges all three
 * @then failures are cleared and every record is synced
 */
TEST_F(SyncManagerTest, AckClearsFailuresAndMarksRecords) {
  auto a = makeNode(a_);
  auto ids = appendRecords(*a.storage, 3, now_ - 1h);
  EXPECT_OUTCOME_TRUE(push, a.manager->createPushResponse(b_));
  ASSERT_EQ(push.records.size(), 3);
  for (int i = 0; i < 5; ++i) {
    a.manager->recordFailure(b_);
  }
  ASSERT_EQ(a.manager->syncState(b_)->get().failed_attempts, 5);

  SyncMessage ack{SyncAck{
      .from_node = b_,
      .record_ids = ids,
      .vector_clock = {},
  }};
  EXPECT_OUTCOME_TRUE_1(a.manager->processSyncAck(ack));

  const auto &state = a.manager->syncState(b_)->get();
  EXPECT_EQ(state.failed_attempts, 0);
  for (const auto &id : ids) {
    EXPECT_TRUE(state.isSynced(id)) << id.toString();
  }
  EXPECT_FALSE(state.hasPending());
}

/**
 * @given no retry allowance and a known peer that never failed
 * @then there is no retry delay
 */
TEST_F(SyncManagerTest, NoRetryDelayWithoutFailures) {
  SyncConfig config;
  config.max_retries = 0;
  auto a = makeNode(a_, config);

  SyncMessage ack{SyncAck{
      .from_node = b_,
      .record_ids = {},
      .vector_clock = {},
  }};
  EXPECT_OUTCOME_TRUE_1(a.manager->processSyncAck(ack));
  EXPECT_EQ(a.manager->retryDelay(b_), 0s);
  EXPECT_TRUE(a.manager->canAttempt(b_));

  a.manager->recordFailure(b_);
  EXPECT_EQ(a.manager->retryDelay(b_), 120s);
}

/**
 * @given many consecutive failures
 * @then the retry delay never exceeds max_backoff_secs
 */
TEST_F(SyncManagerTest, BackoffIsCapped) {
  SyncConfig config;
  config.max_retries = 0;
  config.max_backoff_secs = 300;
  auto a = makeNode(a_, config);

  EXPECT_EQ(a.manager->retryDelay(b_), 0s);
  for (int i = 0; i < 100; ++i) {
    a.manager->recordFailure(b_);
  }
  EXPECT_EQ(a.manager->retryDelay(b_), 300s);
}

/**
 * @given peer synced recently
 * @when the sync interval elapses
 * @then the peer needs a sync again
 */
TEST_F(SyncManagerTest, PeerGoesStaleAfterInterval) {
  SyncConfig config;
  config.sync_interval_secs = 60;
  auto a = makeNode(a_, config);

  SyncMessage ack{SyncAck{
      .from_node = b_,
      .record_ids = {},
      .vector_clock = {},
  }};
  EXPECT_OUTCOME_TRUE_1(a.manager->processSyncAck(ack));
  EXPECT_FALSE(a.manager->needsSync(b_));

  now_ += 60s;
  EXPECT_FALSE(a.manager->needsSync(b_));
  now_ += 1s;
  EXPECT_TRUE(a.manager->needsSync(b_));
}

/**
 * @given response carrying a record modified after hashing
 * @when it is processed
 * @then it is rejected and nothing is marked synced
 */
TEST_F(SyncManagerTest, TamperedRecordIsRejected) {
  auto a = makeNode(a_);
  auto b = makeNode(b_);
  appendRecords(*a.storage, 2, now_ - 1h);

  EXPECT_OUTCOME_TRUE(request, b.manager->createSyncRequest(a_, {}));
  EXPECT_OUTCOME_TRUE(response,
                      a.manager->processSyncRequest(SyncMessage{request}));
  response.records[1].record.result = R"({"eligible":false})";

  EXPECT_EC(b.manager->processSyncResponse(SyncMessage{response}),
            SyncError::TAMPERED_RECORD);
  EXPECT_FALSE(b.manager->syncState(a_).has_value());
  EXPECT_EQ(b.manager->localClock(), VectorClock{});
}

/**
 * @given message of another kind than the handler expects
 * @when it is passed to the handler
 * @then UNEXPECTED_MESSAGE is returned
 */
TEST_F(SyncManagerTest, WrongMessageKindIsRejected) {
  auto a = makeNode(a_);
  SyncMessage request{SyncRequest{
      .from_node = b_,
      .since = {},
      .vector_clock = {},
  }};

  EXPECT_EC(a.manager->processSyncAck(request), SyncError::UNEXPECTED_MESSAGE);
  EXPECT_EC(a.manager->processSyncResponse(request),
            SyncError::UNEXPECTED_MESSAGE);
  EXPECT_EC(a.manager->processHeartbeat(request),
            SyncError::UNEXPECTED_MESSAGE);
}

/**
 * @given message claiming to come from the receiving node
 * @then it is rejected
 */
TEST_F(SyncManagerTest, SelfMessageIsRejected) {
  auto a = makeNode(a_);
  SyncMessage heartbeat{Heartbeat{
      .from_node = a_,
      .vector_clock = {},
      .record_count = 10,
      .last_hash = std::nullopt,
  }};
  EXPECT_EC(a.manager->handleMessage(heartbeat), SyncError::SELF_MESSAGE);
  EXPECT_TRUE(a.manager->knownPeers().empty());
}

/**
 * @given push strategy
 * @when a peer advertises more records
 * @then no pull is produced, while pushing is allowed
 */
TEST_F(SyncManagerTest, PushStrategyNeverPulls) {
  SyncConfig config;
  config.strategy = SyncStrategy::Push;
  auto a = makeNode(a_, config);
  appendRecords(*a.storage, 2, now_ - 1h);

  EXPECT_OUTCOME_TRUE(push, a.manager->createPushResponse(b_));
  EXPECT_EQ(push.records.size(), 2);
  EXPECT_EQ(push.from_node, a_);

  SyncMessage heartbeat{Heartbeat{
      .from_node = b_,
      .vector_clock = {},
      .record_count = 10,
      .last_hash = std::nullopt,
  }};
  EXPECT_OUTCOME_TRUE(reply, a.manager->processHeartbeat(heartbeat));
  EXPECT_FALSE(reply.has_value());
}

/**
 * @given pull strategy
 * @then pushing is refused
 */
TEST_F(SyncManagerTest, PullStrategyRefusesPush) {
  SyncConfig config;
  config.strategy = SyncStrategy::Pull;
  auto a = makeNode(a_, config);
  EXPECT_EC(a.manager->createPushResponse(b_), SyncError::STRATEGY_DISABLED);
}

/**
 * @given records the peer already acknowledged
 * @when a push is prepared
 * @then they are not pushed again
 */
TEST_F(SyncManagerTest, PushSkipsAcknowledgedRecords) {
  auto a = makeNode(a_);
  // stamped after the watermark the ack sets
  auto ids = appendRecords(*a.storage, 3, now_ + 1h);

  SyncMessage ack{SyncAck{
      .from_node = b_,
      .record_ids = {ids[0], ids[1]},
      .vector_clock = {},
  }};
  EXPECT_OUTCOME_TRUE_1(a.manager->processSyncAck(ack));

  EXPECT_OUTCOME_TRUE(push, a.manager->createPushResponse(b_));
  ASSERT_EQ(push.records.size(), 1);
  EXPECT_EQ(push.records[0].id(), ids[2]);
}

/**
 * @given storage failing every read
 * @when records, count or head are needed
 * @then STORAGE_FAILURE is returned and no peer state is created
 */
TEST_F(SyncManagerTest, StorageFailureIsReported) {
  auto storage = std::make_shared<AuditStorageMock>();
  EXPECT_CALL(*storage, getAll())
      .WillRepeatedly(
          Return(outcome::failure(AuditStorageError::RECORD_NOT_FOUND)));
  EXPECT_CALL(*storage, count())
      .WillRepeatedly(
          Return(outcome::failure(AuditStorageError::RECORD_NOT_FOUND)));
  SyncManagerImpl manager{a_, {}, storage, clock_};

  SyncMessage request{SyncRequest{
      .from_node = b_,
      .since = {},
      .vector_clock = {},
  }};
  EXPECT_EC(manager.processSyncRequest(request), SyncError::STORAGE_FAILURE);
  EXPECT_EC(manager.createHeartbeat(), SyncError::STORAGE_FAILURE);
  EXPECT_FALSE(manager.syncState(b_).has_value());
}

/**
 * @given manager tracking two peers
 * @when one is forgotten
 * @then only the other one stays known
 */
TEST_F(SyncManagerTest, ForgetPeerDropsState) {
  auto a = makeNode(a_);
  const NodeId c{"node-c"};
  a.manager->recordFailure(c);
  a.manager->recordFailure(b_);

  EXPECT_EQ(a.manager->knownPeers(), (std::vector<NodeId>{b_, c}));
  EXPECT_TRUE(a.manager->forgetPeer(c));
  EXPECT_FALSE(a.manager->forgetPeer(c));
  EXPECT_EQ(a.manager->knownPeers(), std::vector<NodeId>{b_});
  EXPECT_TRUE(a.manager->needsSync(c));
}
