#pragma once

#include <string>
#include <vector>
#include <memory>

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace receipt_assistant {

struct VectorHit {
    long row;          // insertion position, 0-based
    float distance;    // Euclidean (not squared)
};

// Thin owner of a FAISS L2 index. Rows are numbered in insertion order, so
// callers keep their own row -> record table. Not synchronized.
class FaissVectorStore {
public:
    enum class IndexKind { Flat, HNSW };

    FaissVectorStore(int dimension, IndexKind kind);
    ~FaissVectorStore(); // Destructor must be defined in .cpp

    FaissVectorStore(const FaissVectorStore&) = delete;
    FaissVectorStore& operator=(const FaissVectorStore&) = delete;

    // Returns the row assigned to the vector. Throws std::invalid_argument on
    // a dimension mismatch.
    long add(const std::vector<float>& vector);

    // Up to k hits ordered by distance, ties by row.
    std::vector<VectorHit> search(const std::vector<float>& query_vector, int k) const;

    long size() const;
    int dimension() const { return dimension_; }

    static IndexKind parse_kind(const std::string& name);

private:
    int dimension_;
    std::unique_ptr<faiss::Index> index_;
};

} // namespace receipt_assistant
