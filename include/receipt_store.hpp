#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "embedding_service.hpp"
#include "errors.hpp"
#include "faiss_vector_store.hpp"
#include "receipt_journal.hpp"
#include "receipt_types.hpp"

namespace receipt_assistant {

using ReceiptPtr = std::shared_ptr<const ReceiptRecord>;

// Inclusive on both ends; an absent amount bound is unbounded on that side.
struct MetadataQuery {
    Timestamp start_time{};
    Timestamp end_time{};
    std::optional<double> min_amount;
    std::optional<double> max_amount;
};

struct SimilarityHit {
    ReceiptPtr record;
    float distance;
};

// Receipts keyed by receipt_id, each carrying an embedding of its canonical
// text. Writers are serialized. Metadata and id lookups read an immutable
// snapshot without locking; similarity search holds a shared lock on the
// vector index only while FAISS runs.
class ReceiptStore {
public:
    ReceiptStore(std::shared_ptr<EmbeddingGateway> embeddings,
                 const std::string& data_dir,
                 FaissVectorStore::IndexKind index_kind = FaissVectorStore::IndexKind::Flat);

    ReceiptStore(const ReceiptStore&) = delete;
    ReceiptStore& operator=(const ReceiptStore&) = delete;

    // Embeds canonical_text(record) and inserts it. DuplicateReceipt when the
    // receipt_id exists; exactly one of several concurrent writers of the same
    // id succeeds.
    Result<ReceiptPtr> store(ReceiptRecord record);

    // Records inside both ranges, in insertion order.
    Result<std::vector<ReceiptPtr>> search_by_metadata(const MetadataQuery& query) const;

    // The `limit` nearest records to embed(query_text), nearest first.
    Result<std::vector<SimilarityHit>> search_by_similarity(const std::string& query_text, int limit) const;

    Result<ReceiptPtr> get_by_id(const std::string& receipt_id) const;

    bool contains(const std::string& receipt_id) const;
    size_t size() const;
    int dimension() const { return dimension_; }

private:
    // Published copy-on-write by writers; readers keep whichever version
    // they loaded.
    struct Snapshot {
        std::vector<ReceiptPtr> rows;                        // row == FAISS label
        std::unordered_map<std::string, size_t> id_to_row;
    };

    void replay_journal();
    std::shared_ptr<const Snapshot> snapshot() const;
    void publish(std::shared_ptr<const Snapshot> next);

    std::shared_ptr<EmbeddingGateway> embeddings_;
    int dimension_;

    // Serializes writers across the duplicate check, journal append and publish.
    std::mutex write_mutex_;
    ReceiptJournal journal_;

    // FAISS indexes do not allow add() concurrent with search().
    mutable std::shared_mutex index_mutex_;
    FaissVectorStore index_;

    std::shared_ptr<const Snapshot> snapshot_;
};

} // namespace receipt_assistant
