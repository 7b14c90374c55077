/**
 * @file test_receipt_store.cpp
 * @brief Receipt store: at-most-once writes, range filters, similarity search, journal replay
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <thread>
#include "receipt_store.hpp"
#include "test_support.hpp"

using namespace receipt_assistant;
using namespace receipt_assistant::test_support;

namespace {

std::vector<std::string> ids_of(const std::vector<ReceiptPtr>& records) {
    std::vector<std::string> ids;
    for (const auto& r : records) ids.push_back(r->receipt_id);
    return ids;
}

bool contains_id(const std::vector<ReceiptPtr>& records, const std::string& id) {
    auto ids = ids_of(records);
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

MetadataQuery range(const std::string& start, const std::string& end,
                    std::optional<double> min_amount = std::nullopt,
                    std::optional<double> max_amount = std::nullopt) {
    MetadataQuery q;
    q.start_time = ts(start);
    q.end_time = ts(end);
    q.min_amount = min_amount;
    q.max_amount = max_amount;
    return q;
}

} // namespace

class ReceiptStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        embeddings = std::make_shared<FakeEmbeddingGateway>(4);
        store = std::make_unique<ReceiptStore>(embeddings, dir.str());
    }

    TempDir dir;
    std::shared_ptr<FakeEmbeddingGateway> embeddings;
    std::unique_ptr<ReceiptStore> store;
};

TEST_F(ReceiptStoreTest, StoreAttachesEmbeddingOfCanonicalText) {
    auto record = make_receipt("r1", "Cafe X", 15000, "2024-03-01T10:00:00Z");
    record.purchased_items = {{"Latte", 5000}, {"Croissant", 10000}};
    embeddings->set_vector(canonical_text(record), {1, 2, 3, 4});

    auto result = store->store(record);
    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result.value()->embedding, (std::vector<float>{1, 2, 3, 4}));
    EXPECT_EQ(result.value()->purchased_items.size(), 2u);
    EXPECT_EQ(embeddings->calls.load(), 1);
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(ReceiptStoreTest, CanonicalTextCoversStoreItemsAndAmount) {
    auto record = make_receipt("r1", "Cafe X", 15000, "2024-03-01T10:00:00Z");
    record.purchased_items = {{"Latte", 5000}, {"Croissant", 10000}};

    EXPECT_EQ(canonical_text(record),
              "Store: Cafe X\nItems: Latte (5000.00), Croissant (10000.00)\nTotal: 15000.00 IDR");

    record.purchased_items.clear();
    EXPECT_EQ(canonical_text(record), "Store: Cafe X\nItems: none\nTotal: 15000.00 IDR");
}

TEST_F(ReceiptStoreTest, SecondStoreOfSameIdIsRejected) {
    auto record = make_receipt("r1", "Cafe X", 15000, "2024-03-01T10:00:00Z");

    ASSERT_TRUE(store->store(record).ok());

    auto changed = record;
    changed.store_name = "Cafe Y";
    auto second = store->store(changed);
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.code(), ErrorCode::DuplicateReceipt);

    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(store->get_by_id("r1").value()->store_name, "Cafe X");
    // The early reject skips the embedding call.
    EXPECT_EQ(embeddings->calls.load(), 1);
}

TEST_F(ReceiptStoreTest, ConcurrentWritersOfOneIdProduceExactlyOneWinner) {
    constexpr int kWriters = 16;
    std::atomic<int> successes{0};
    std::atomic<int> duplicates{0};
    std::atomic<int> others{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([&, i] {
            auto record = make_receipt("same-id", "Store " + std::to_string(i), 100 + i, "2024-05-01T08:00:00Z");
            auto result = store->store(record);
            if (result.ok()) {
                ++successes;
            } else if (result.code() == ErrorCode::DuplicateReceipt) {
                ++duplicates;
            } else {
                ++others;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(duplicates.load(), kWriters - 1);
    EXPECT_EQ(others.load(), 0);
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(ReceiptStoreTest, ReadersSeeWholeRecordsWhileWritersAppend) {
    constexpr int kRecords = 40;
    std::atomic<bool> done{false};
    std::atomic<int> torn_reads{0};

    std::thread writer([&] {
        for (int i = 0; i < kRecords; ++i) {
            auto record = make_receipt("c" + std::to_string(i), "Shop " + std::to_string(i), 100 + i,
                                       "2024-05-01T08:00:00Z");
            EXPECT_TRUE(store->store(record).ok());
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                size_t seen = store->size();
                auto all = store->search_by_metadata(range("2024-01-01T00:00:00Z", "2024-12-31T00:00:00Z"));
                auto similar = store->search_by_similarity("Shop", 3);
                if (!all.ok() || !similar.ok()) {
                    ++torn_reads;
                    continue;
                }
                if (all.value().size() < seen) ++torn_reads;
                for (const auto& record : all.value()) {
                    if (!store->get_by_id(record->receipt_id).ok()) ++torn_reads;
                }
                for (const auto& hit : similar.value()) {
                    if (!hit.record) ++torn_reads;
                }
            }
        });
    }

    writer.join();
    for (auto& t : readers) t.join();

    EXPECT_EQ(torn_reads.load(), 0);
    EXPECT_EQ(store->size(), static_cast<size_t>(kRecords));
}

TEST_F(ReceiptStoreTest, MetadataScenarioFromCafeReceipt) {
    ASSERT_TRUE(store->store(make_receipt("r1", "Cafe X", 15000, "2024-03-01T10:00:00Z")).ok());

    auto in_range = store->search_by_metadata(range("2024-01-01T00:00:00Z", "2024-12-31T23:59:59Z", 10000.0, 20000.0));
    ASSERT_TRUE(in_range.ok());
    EXPECT_TRUE(contains_id(in_range.value(), "r1"));

    auto too_cheap = store->search_by_metadata(range("2024-01-01T00:00:00Z", "2024-12-31T23:59:59Z", 50000.0));
    ASSERT_TRUE(too_cheap.ok());
    EXPECT_FALSE(contains_id(too_cheap.value(), "r1"));
}

TEST_F(ReceiptStoreTest, MetadataBoundsAreInclusiveAndUnboundedWhenAbsent) {
    ASSERT_TRUE(store->store(make_receipt("a", "A", 10, "2024-01-01T00:00:00Z")).ok());
    ASSERT_TRUE(store->store(make_receipt("b", "B", 20, "2024-02-01T00:00:00Z")).ok());
    ASSERT_TRUE(store->store(make_receipt("c", "C", 30, "2024-03-01T00:00:00Z")).ok());
    ASSERT_TRUE(store->store(make_receipt("d", "D", 0, "2023-12-31T23:59:59Z")).ok());

    auto exact = store->search_by_metadata(range("2024-01-01T00:00:00Z", "2024-02-01T00:00:00Z", 10.0, 20.0));
    EXPECT_EQ(ids_of(exact.value()), (std::vector<std::string>{"a", "b"}));

    auto everything = store->search_by_metadata(range("2000-01-01T00:00:00Z", "2100-01-01T00:00:00Z"));
    EXPECT_EQ(ids_of(everything.value()), (std::vector<std::string>{"a", "b", "c", "d"}));

    auto at_least_20 = store->search_by_metadata(range("2000-01-01T00:00:00Z", "2100-01-01T00:00:00Z", 20.0));
    EXPECT_EQ(ids_of(at_least_20.value()), (std::vector<std::string>{"b", "c"}));

    auto at_most_10 = store->search_by_metadata(range("2000-01-01T00:00:00Z", "2100-01-01T00:00:00Z",
                                                      std::nullopt, 10.0));
    EXPECT_EQ(ids_of(at_most_10.value()), (std::vector<std::string>{"a", "d"}));

    auto single_instant = store->search_by_metadata(range("2024-03-01T00:00:00Z", "2024-03-01T00:00:00Z"));
    EXPECT_EQ(ids_of(single_instant.value()), (std::vector<std::string>{"c"}));
}

TEST_F(ReceiptStoreTest, InvertedRangesAreRejected) {
    auto times = store->search_by_metadata(range("2024-12-31T00:00:00Z", "2024-01-01T00:00:00Z"));
    ASSERT_FALSE(times.ok());
    EXPECT_EQ(times.code(), ErrorCode::InvalidRange);

    auto amounts = store->search_by_metadata(range("2024-01-01T00:00:00Z", "2024-12-31T00:00:00Z", 50.0, 10.0));
    ASSERT_FALSE(amounts.ok());
    EXPECT_EQ(amounts.code(), ErrorCode::InvalidRange);
}

TEST_F(ReceiptStoreTest, SimilarityReturnsNearestFirstWithinLimit) {
    auto near = make_receipt("near", "Coffee Bar", 5, "2024-01-01T00:00:00Z");
    auto mid = make_receipt("mid", "Bakery", 6, "2024-01-02T00:00:00Z");
    auto far = make_receipt("far", "Hardware", 7, "2024-01-03T00:00:00Z");
    embeddings->set_vector(canonical_text(far), {10, 0, 0, 0});
    embeddings->set_vector(canonical_text(mid), {3, 0, 0, 0});
    embeddings->set_vector(canonical_text(near), {1, 0, 0, 0});
    embeddings->set_vector("coffee", {0, 0, 0, 0});

    ASSERT_TRUE(store->store(far).ok());
    ASSERT_TRUE(store->store(mid).ok());
    ASSERT_TRUE(store->store(near).ok());

    auto hits = store->search_by_similarity("coffee", 2);
    ASSERT_TRUE(hits.ok());
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(hits.value()[0].record->receipt_id, "near");
    EXPECT_EQ(hits.value()[1].record->receipt_id, "mid");
    EXPECT_FLOAT_EQ(hits.value()[0].distance, 1.0f);
    EXPECT_FLOAT_EQ(hits.value()[1].distance, 3.0f);

    auto all = store->search_by_similarity("coffee", 10);
    ASSERT_EQ(all.value().size(), 3u);
    for (size_t i = 1; i < all.value().size(); ++i) {
        EXPECT_LE(all.value()[i - 1].distance, all.value()[i].distance);
    }
}

TEST_F(ReceiptStoreTest, SimilarityTiesFollowInsertionOrder) {
    auto first = make_receipt("first", "One", 1, "2024-01-01T00:00:00Z");
    auto second = make_receipt("second", "Two", 2, "2024-01-01T00:00:00Z");
    auto third = make_receipt("third", "Three", 3, "2024-01-01T00:00:00Z");
    embeddings->set_vector(canonical_text(first), {0, 2, 0, 0});
    embeddings->set_vector(canonical_text(second), {0, 0, 2, 0});
    embeddings->set_vector(canonical_text(third), {0, 0, 0, 2});
    embeddings->set_vector("query", {0, 0, 0, 0});

    ASSERT_TRUE(store->store(first).ok());
    ASSERT_TRUE(store->store(second).ok());
    ASSERT_TRUE(store->store(third).ok());

    auto hits = store->search_by_similarity("query", 2);
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(hits.value()[0].record->receipt_id, "first");
    EXPECT_EQ(hits.value()[1].record->receipt_id, "second");
}

TEST_F(ReceiptStoreTest, SimilarityOnEmptyStoreIsEmpty) {
    auto hits = store->search_by_similarity("anything", 5);
    ASSERT_TRUE(hits.ok());
    EXPECT_TRUE(hits.value().empty());
}

TEST_F(ReceiptStoreTest, SimilarityRejectsNonPositiveLimit) {
    auto hits = store->search_by_similarity("anything", 0);
    ASSERT_FALSE(hits.ok());
    EXPECT_EQ(hits.code(), ErrorCode::InvalidArgument);
}

TEST_F(ReceiptStoreTest, GatewayFailuresSurfaceWithoutRetry) {
    embeddings->fail_with(GatewayError::Kind::Unavailable);
    auto stored = store->store(make_receipt("r1", "Cafe X", 1, "2024-01-01T00:00:00Z"));
    ASSERT_FALSE(stored.ok());
    EXPECT_EQ(stored.code(), ErrorCode::EmbeddingUnavailable);
    EXPECT_EQ(store->size(), 0u);

    auto searched = store->search_by_similarity("x", 3);
    EXPECT_EQ(searched.code(), ErrorCode::EmbeddingUnavailable);
    EXPECT_EQ(embeddings->calls.load(), 2);

    embeddings->fail_with(GatewayError::Kind::Timeout);
    EXPECT_EQ(store->search_by_similarity("x", 3).code(), ErrorCode::GatewayTimeout);

    // Nothing was written, so the same receipt can be stored once the gateway recovers.
    embeddings->recover();
    EXPECT_TRUE(store->store(make_receipt("r1", "Cafe X", 1, "2024-01-01T00:00:00Z")).ok());
}

TEST_F(ReceiptStoreTest, WrongEmbeddingDimensionIsAnEmbeddingFailure) {
    auto record = make_receipt("r1", "Cafe X", 1, "2024-01-01T00:00:00Z");
    embeddings->set_vector(canonical_text(record), {1, 2});
    auto stored = store->store(record);
    ASSERT_FALSE(stored.ok());
    EXPECT_EQ(stored.code(), ErrorCode::EmbeddingUnavailable);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(ReceiptStoreTest, GetByIdReportsAbsence) {
    auto missing = store->get_by_id("nope");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.code(), ErrorCode::NotFound);
}

TEST_F(ReceiptStoreTest, RejectsEmptyIdAndNegativeAmount) {
    EXPECT_EQ(store->store(make_receipt("", "X", 1, "2024-01-01T00:00:00Z")).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(store->store(make_receipt("r", "X", -1, "2024-01-01T00:00:00Z")).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(embeddings->calls.load(), 0);
}

TEST_F(ReceiptStoreTest, ReopenReplaysJournal) {
    auto record = make_receipt("r1", "Cafe X", 15000, "2024-03-01T10:00:00Z");
    record.purchased_items = {{"Latte", 15000}};
    ASSERT_TRUE(store->store(record).ok());
    ASSERT_TRUE(store->store(make_receipt("r2", "Market", 42.5, "2024-04-02T09:30:00Z", "USD")).ok());
    store.reset();

    ReceiptStore reopened(embeddings, dir.str());
    EXPECT_EQ(reopened.size(), 2u);

    auto r1 = reopened.get_by_id("r1");
    ASSERT_TRUE(r1.ok());
    EXPECT_EQ(r1.value()->store_name, "Cafe X");
    EXPECT_EQ(format_timestamp(r1.value()->transaction_time), "2024-03-01T10:00:00Z");
    ASSERT_EQ(r1.value()->purchased_items.size(), 1u);
    EXPECT_EQ(r1.value()->purchased_items[0].name, "Latte");

    EXPECT_EQ(reopened.store(record).code(), ErrorCode::DuplicateReceipt);

    auto hits = reopened.search_by_similarity("Market", 2);
    ASSERT_TRUE(hits.ok());
    EXPECT_EQ(hits.value().size(), 2u);
}

TEST_F(ReceiptStoreTest, ReplaySkipsCorruptLines) {
    ASSERT_TRUE(store->store(make_receipt("r1", "Cafe X", 1, "2024-03-01T10:00:00Z")).ok());
    store.reset();

    {
        std::ofstream out(dir.path() / "receipts.jsonl", std::ios::app);
        out << "{not json\n";
    }

    ReceiptStore reopened(embeddings, dir.str());
    EXPECT_EQ(reopened.size(), 1u);
    EXPECT_TRUE(reopened.store(make_receipt("r2", "Y", 2, "2024-03-02T10:00:00Z")).ok());
    EXPECT_EQ(reopened.size(), 2u);
}

TEST_F(ReceiptStoreTest, HnswIndexAnswersSmallQueries) {
    TempDir hnsw_dir;
    ReceiptStore hnsw(embeddings, hnsw_dir.str(), FaissVectorStore::IndexKind::HNSW);

    auto a = make_receipt("a", "A", 1, "2024-01-01T00:00:00Z");
    auto b = make_receipt("b", "B", 2, "2024-01-01T00:00:00Z");
    embeddings->set_vector(canonical_text(a), {5, 5, 5, 5});
    embeddings->set_vector(canonical_text(b), {1, 1, 1, 1});
    embeddings->set_vector("nearby query", {1, 1, 1, 0});
    ASSERT_TRUE(hnsw.store(a).ok());
    ASSERT_TRUE(hnsw.store(b).ok());

    auto hits = hnsw.search_by_similarity("nearby query", 1);
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_EQ(hits.value()[0].record->receipt_id, "b");
}

TEST_F(ReceiptStoreTest, TornTailDoesNotSwallowTheNextRecord) {
    ASSERT_TRUE(store->store(make_receipt("r1", "Cafe X", 1, "2024-03-01T10:00:00Z")).ok());
    store.reset();

    {
        std::ofstream out(dir.path() / "receipts.jsonl", std::ios::app | std::ios::binary);
        out << R"({"receipt_id":"torn)";
    }

    {
        ReceiptStore reopened(embeddings, dir.str());
        EXPECT_EQ(reopened.size(), 1u);
        ASSERT_TRUE(reopened.store(make_receipt("r2", "Market", 2, "2024-03-02T10:00:00Z")).ok());
    }

    ReceiptStore restarted(embeddings, dir.str());
    EXPECT_EQ(restarted.size(), 2u);
    EXPECT_TRUE(restarted.get_by_id("r1").ok());
    ASSERT_TRUE(restarted.get_by_id("r2").ok());
    EXPECT_EQ(restarted.get_by_id("r2").value()->store_name, "Market");
    EXPECT_EQ(restarted.get_by_id("torn").code(), ErrorCode::NotFound);
}

TEST_F(ReceiptStoreTest, CompleteLastRecordWithoutNewlineIsKept) {
    ASSERT_TRUE(store->store(make_receipt("r1", "Cafe X", 1, "2024-03-01T10:00:00Z")).ok());
    store.reset();

    // Strip the final newline, as if the process died right before writing it.
    auto journal = dir.path() / "receipts.jsonl";
    std::filesystem::resize_file(journal, std::filesystem::file_size(journal) - 1);

    {
        ReceiptStore reopened(embeddings, dir.str());
        EXPECT_EQ(reopened.size(), 1u);
        ASSERT_TRUE(reopened.store(make_receipt("r2", "Market", 2, "2024-03-02T10:00:00Z")).ok());
    }

    ReceiptStore restarted(embeddings, dir.str());
    EXPECT_EQ(restarted.size(), 2u);
    EXPECT_TRUE(restarted.get_by_id("r1").ok());
    EXPECT_TRUE(restarted.get_by_id("r2").ok());
}
