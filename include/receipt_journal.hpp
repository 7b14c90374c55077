#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "receipt_types.hpp"

namespace receipt_assistant {

// Append-only JSONL file of full receipt records, one per line. It is the
// durable copy of the store; the vector index is rebuilt from it on open.
class ReceiptJournal {
public:
    explicit ReceiptJournal(const std::string& data_dir);

    // Records in file order. Unparseable lines are skipped and counted.
    std::vector<ReceiptRecord> replay(size_t& skipped_lines);

    // Returns false if the line could not be written and flushed; the file
    // is then cut back to its size before the call.
    bool append(const ReceiptRecord& record);

    const std::filesystem::path& path() const { return path_; }

private:
    void repair_tail();
    void open_for_append();

    std::filesystem::path path_;
    std::ofstream out_;
};

} // namespace receipt_assistant
