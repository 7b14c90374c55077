#include "receipt_store.hpp"
#include <spdlog/spdlog.h>

namespace receipt_assistant {

ReceiptStore::ReceiptStore(std::shared_ptr<EmbeddingGateway> embeddings,
                           const std::string& data_dir,
                           FaissVectorStore::IndexKind index_kind)
    : embeddings_(std::move(embeddings)),
      dimension_(embeddings_->dimension()),
      journal_(data_dir),
      index_(dimension_, index_kind),
      snapshot_(std::make_shared<const Snapshot>()) {
    replay_journal();
}

std::shared_ptr<const ReceiptStore::Snapshot> ReceiptStore::snapshot() const {
    return std::atomic_load(&snapshot_);
}

void ReceiptStore::publish(std::shared_ptr<const Snapshot> next) {
    std::atomic_store(&snapshot_, std::move(next));
}

void ReceiptStore::replay_journal() {
    size_t skipped = 0;
    auto records = journal_.replay(skipped);

    auto loaded = std::make_shared<Snapshot>();
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    for (auto& record : records) {
        if (loaded->id_to_row.count(record.receipt_id)) {
            spdlog::warn("⚠️ Journal repeats receipt {}; keeping the first copy", record.receipt_id);
            ++skipped;
            continue;
        }
        if (static_cast<int>(record.embedding.size()) != dimension_) {
            spdlog::error("❌ Receipt {} has a {}-d embedding, store is {}-d; skipped",
                          record.receipt_id, record.embedding.size(), dimension_);
            ++skipped;
            continue;
        }
        long row = index_.add(record.embedding);
        loaded->id_to_row[record.receipt_id] = static_cast<size_t>(row);
        loaded->rows.push_back(std::make_shared<const ReceiptRecord>(std::move(record)));
    }
    lock.unlock();

    spdlog::info("📂 Receipt store opened at {}: {} records, {} skipped",
                 journal_.path().string(), loaded->rows.size(), skipped);
    publish(std::move(loaded));
}

Result<ReceiptPtr> ReceiptStore::store(ReceiptRecord record) {
    if (record.receipt_id.empty()) {
        return Result<ReceiptPtr>::failure(ErrorCode::InvalidArgument, "receipt_id must not be empty");
    }
    if (record.total_amount < 0) {
        return Result<ReceiptPtr>::failure(ErrorCode::InvalidArgument, "total_amount must not be negative");
    }

    // Cheap early reject: skip the billed embedding call for a known id.
    if (contains(record.receipt_id)) {
        spdlog::info("Receipt {} already stored; write rejected", record.receipt_id);
        return Result<ReceiptPtr>::failure(ErrorCode::DuplicateReceipt,
                                           "receipt " + record.receipt_id + " already exists");
    }

    try {
        record.embedding = embeddings_->embed(canonical_text(record));
    } catch (const GatewayError& e) {
        spdlog::warn("⚠️ Embedding failed for receipt {}: {}", record.receipt_id, e.what());
        return Result<ReceiptPtr>::failure(e.as_embedding_error(), e.what());
    }
    if (static_cast<int>(record.embedding.size()) != dimension_) {
        return Result<ReceiptPtr>::failure(ErrorCode::EmbeddingUnavailable,
            "embedding gateway returned " + std::to_string(record.embedding.size()) +
            " components, expected " + std::to_string(dimension_));
    }

    std::lock_guard<std::mutex> write_lock(write_mutex_);

    // Authoritative check. Only writers publish, and they hold write_mutex_.
    auto current = snapshot();
    if (current->id_to_row.count(record.receipt_id)) {
        spdlog::info("Receipt {} lost a concurrent write race; rejected", record.receipt_id);
        return Result<ReceiptPtr>::failure(ErrorCode::DuplicateReceipt,
                                           "receipt " + record.receipt_id + " already exists");
    }

    if (!journal_.append(record)) {
        spdlog::error("❌ Journal append failed for receipt {}", record.receipt_id);
        return Result<ReceiptPtr>::failure(ErrorCode::StorageFailure,
                                           "could not persist receipt " + record.receipt_id);
    }

    auto stored = std::make_shared<const ReceiptRecord>(std::move(record));
    auto next = std::make_shared<Snapshot>(*current);
    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        long row = index_.add(stored->embedding);
        next->id_to_row[stored->receipt_id] = static_cast<size_t>(row);
    }
    next->rows.push_back(stored);
    publish(std::move(next));

    spdlog::info("🧾 Stored receipt {} ({} {:.2f} {})", stored->receipt_id, stored->store_name,
                 stored->total_amount, stored->currency);
    return Result<ReceiptPtr>::success(stored);
}

Result<std::vector<ReceiptPtr>> ReceiptStore::search_by_metadata(const MetadataQuery& query) const {
    if (query.start_time > query.end_time) {
        return Result<std::vector<ReceiptPtr>>::failure(ErrorCode::InvalidRange,
            "start_time " + format_timestamp(query.start_time) + " is after end_time " +
            format_timestamp(query.end_time));
    }
    if (query.min_amount && query.max_amount && *query.min_amount > *query.max_amount) {
        return Result<std::vector<ReceiptPtr>>::failure(ErrorCode::InvalidRange,
                                                        "min_amount is greater than max_amount");
    }

    std::vector<ReceiptPtr> matches;
    for (const auto& record : snapshot()->rows) {
        if (record->transaction_time < query.start_time || record->transaction_time > query.end_time) continue;
        if (query.min_amount && record->total_amount < *query.min_amount) continue;
        if (query.max_amount && record->total_amount > *query.max_amount) continue;
        matches.push_back(record);
    }
    return Result<std::vector<ReceiptPtr>>::success(std::move(matches));
}

Result<std::vector<SimilarityHit>> ReceiptStore::search_by_similarity(const std::string& query_text,
                                                                      int limit) const {
    if (limit <= 0) {
        return Result<std::vector<SimilarityHit>>::failure(ErrorCode::InvalidArgument,
                                                           "limit must be greater than zero");
    }

    std::vector<float> query_vector;
    try {
        query_vector = embeddings_->embed(query_text);
    } catch (const GatewayError& e) {
        spdlog::warn("⚠️ Query embedding failed: {}", e.what());
        return Result<std::vector<SimilarityHit>>::failure(e.as_embedding_error(), e.what());
    }
    if (static_cast<int>(query_vector.size()) != dimension_) {
        return Result<std::vector<SimilarityHit>>::failure(ErrorCode::EmbeddingUnavailable,
            "embedding gateway returned " + std::to_string(query_vector.size()) +
            " components, expected " + std::to_string(dimension_));
    }

    std::vector<VectorHit> nearest;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        nearest = index_.search(query_vector, limit);
    }

    // A row added after the search but not yet published is skipped.
    auto current = snapshot();
    std::vector<SimilarityHit> hits;
    for (const auto& hit : nearest) {
        if (hit.row < 0 || static_cast<size_t>(hit.row) >= current->rows.size()) continue;
        hits.push_back({current->rows[static_cast<size_t>(hit.row)], hit.distance});
    }
    return Result<std::vector<SimilarityHit>>::success(std::move(hits));
}

Result<ReceiptPtr> ReceiptStore::get_by_id(const std::string& receipt_id) const {
    auto current = snapshot();
    auto it = current->id_to_row.find(receipt_id);
    if (it == current->id_to_row.end()) {
        return Result<ReceiptPtr>::failure(ErrorCode::NotFound, "no receipt with id " + receipt_id);
    }
    return Result<ReceiptPtr>::success(current->rows[it->second]);
}

bool ReceiptStore::contains(const std::string& receipt_id) const {
    return snapshot()->id_to_row.count(receipt_id) > 0;
}

size_t ReceiptStore::size() const {
    return snapshot()->rows.size();
}

} // namespace receipt_assistant
