#include "receipt_journal.hpp"
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace receipt_assistant {

namespace fs = std::filesystem;
using json = nlohmann::json;

ReceiptJournal::ReceiptJournal(const std::string& data_dir) {
    fs::path dir(data_dir);
    fs::create_directories(dir);
    path_ = dir / "receipts.jsonl";
}

std::vector<ReceiptRecord> ReceiptJournal::replay(size_t& skipped_lines) {
    std::vector<ReceiptRecord> records;
    skipped_lines = 0;

    {
        std::ifstream in(path_);
        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.empty()) continue;
            try {
                records.push_back(ReceiptRecord::from_json(json::parse(line)));
            } catch (const std::exception& e) {
                ++skipped_lines;
                spdlog::error("❌ Corrupt journal line {} in {}: {}", line_no, path_.string(), e.what());
            }
        }
    }

    repair_tail();
    open_for_append();
    return records;
}

// A crash mid-append leaves a last line without '\n'. A complete record just
// gets its newline; a torn one (already skipped above) is cut off so the next
// record starts on a line of its own.
void ReceiptJournal::repair_tail() {
    std::error_code ec;
    auto size = fs::file_size(path_, ec);
    if (ec || size == 0) return;

    std::string content;
    {
        std::ifstream in(path_, std::ios::binary);
        content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    if (content.empty() || content.back() == '\n') return;

    auto last_newline = content.find_last_of('\n');
    std::uintmax_t keep = last_newline == std::string::npos ? 0 : last_newline + 1;

    if (json::accept(content.substr(keep))) {
        std::ofstream out(path_, std::ios::app | std::ios::binary);
        out << '\n';
        if (!out) throw std::runtime_error("Cannot terminate last journal line in " + path_.string());
        return;
    }

    fs::resize_file(path_, keep, ec);
    if (ec) {
        throw std::runtime_error("Cannot truncate torn journal tail in " + path_.string() + ": " + ec.message());
    }
    spdlog::warn("✂️ Dropped {} byte(s) of torn tail from {}", size - keep, path_.string());
}

void ReceiptJournal::open_for_append() {
    out_.open(path_, std::ios::app | std::ios::binary);
    if (!out_.is_open()) throw std::runtime_error("Cannot open receipt journal for append: " + path_.string());
}

bool ReceiptJournal::append(const ReceiptRecord& record) {
    if (!out_.is_open()) return false;

    std::error_code ec;
    auto committed = fs::file_size(path_, ec);
    if (ec) return false;

    out_ << record.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    out_.flush();
    if (out_) return true;

    // Partial write: roll the file back to the last complete line.
    out_.close();
    out_.clear();
    fs::resize_file(path_, committed, ec);
    if (ec) {
        spdlog::error("❌ Could not roll back partial journal write in {}: {}", path_.string(), ec.message());
    }
    out_.open(path_, std::ios::app | std::ios::binary);
    return false;
}

} // namespace receipt_assistant
