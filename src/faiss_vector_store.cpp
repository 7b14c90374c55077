#include "faiss_vector_store.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace receipt_assistant {

namespace {
// Extra neighbours fetched so equal-distance rows just past k can still win
// on insertion order.
constexpr int kTieSlack = 8;
}

FaissVectorStore::FaissVectorStore(int dimension, IndexKind kind) : dimension_(dimension) {
    if (dimension <= 0) throw std::invalid_argument("vector dimension must be positive");

    if (kind == IndexKind::HNSW) {
        auto idx = new faiss::IndexHNSWFlat(dimension, 32, faiss::METRIC_L2);
        idx->hnsw.efConstruction = 40;
        idx->hnsw.efSearch = 16;
        index_.reset(idx);
    } else {
        index_.reset(new faiss::IndexFlatL2(dimension));
    }
}

FaissVectorStore::~FaissVectorStore() {
}

FaissVectorStore::IndexKind FaissVectorStore::parse_kind(const std::string& name) {
    if (name == "flat") return IndexKind::Flat;
    if (name == "hnsw") return IndexKind::HNSW;
    throw std::invalid_argument("unknown vector index kind: " + name);
}

long FaissVectorStore::add(const std::vector<float>& vector) {
    if (static_cast<int>(vector.size()) != dimension_) {
        throw std::invalid_argument("vector has " + std::to_string(vector.size()) +
                                    " components, index expects " + std::to_string(dimension_));
    }
    long row = static_cast<long>(index_->ntotal);
    index_->add(1, vector.data());
    return row;
}

std::vector<VectorHit> FaissVectorStore::search(const std::vector<float>& query_vector, int k) const {
    if (index_->ntotal == 0 || k <= 0) return {};
    if (static_cast<int>(query_vector.size()) != dimension_) {
        throw std::invalid_argument("query has " + std::to_string(query_vector.size()) +
                                    " components, index expects " + std::to_string(dimension_));
    }

    faiss::idx_t fetch = std::min<faiss::idx_t>(index_->ntotal, static_cast<faiss::idx_t>(k) + kTieSlack);

    std::vector<float> distances(fetch);
    std::vector<faiss::idx_t> labels(fetch);
    index_->search(1, query_vector.data(), fetch, distances.data(), labels.data());

    std::vector<VectorHit> hits;
    hits.reserve(fetch);
    for (faiss::idx_t i = 0; i < fetch; ++i) {
        if (labels[i] < 0) continue;
        // FAISS reports squared L2.
        hits.push_back({static_cast<long>(labels[i]), std::sqrt(std::max(0.0f, distances[i]))});
    }

    std::stable_sort(hits.begin(), hits.end(), [](const VectorHit& a, const VectorHit& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.row < b.row;
    });

    if (hits.size() > static_cast<size_t>(k)) hits.resize(k);
    return hits;
}

long FaissVectorStore::size() const {
    return static_cast<long>(index_->ntotal);
}

} // namespace receipt_assistant
