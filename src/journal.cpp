#include "floorstock/journal.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/helpers.hpp"
#include "floorstock/logging.hpp"
#include <filesystem>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/util/delimited_message_util.h>

namespace floorstock {

namespace {

events::JournalEntry make_entry(uint64_t sequence, const google::protobuf::Message& event) {
    events::JournalEntry entry;
    entry.set_sequence(sequence);
    entry.mutable_event()->PackFrom(event, helpers::TYPE_URL_PREFIX);
    *entry.mutable_recorded_at() = helpers::now();
    return entry;
}

} // anonymous namespace

// =============================================================================
// MemoryJournal
// =============================================================================

events::JournalEntry MemoryJournal::append(const google::protobuf::Message& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = make_entry(entries_.size() + 1, event);
    entries_.push_back(entry);
    return entry;
}

std::vector<events::JournalEntry> MemoryJournal::read_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

uint64_t MemoryJournal::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// =============================================================================
// FileJournal
// =============================================================================

FileJournal::FileJournal(const std::string& path) : path_(path) {
    int64_t intact_bytes = 0;
    auto existing = load(&intact_bytes);
    if (!existing.empty()) {
        last_sequence_ = existing.back().sequence();
    }

    std::error_code ec;
    if (std::filesystem::exists(path_, ec) &&
        std::filesystem::file_size(path_, ec) > static_cast<uintmax_t>(intact_bytes)) {
        std::filesystem::resize_file(path_, static_cast<uintmax_t>(intact_bytes), ec);
        if (ec) {
            throw InventoryError::storage_failure("Cannot truncate torn journal tail: " + path_);
        }
    }
    size_ = intact_bytes;

    out_.open(path_, std::ios::binary | std::ios::app);
    if (!out_) {
        throw InventoryError::storage_failure("Cannot open journal for append: " + path_);
    }

    log_info("journal", "journal_opened",
        {{"path", path_}, {"entries", existing.size()}, {"last_sequence", last_sequence_}});
}

events::JournalEntry FileJournal::append(const google::protobuf::Message& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = make_entry(last_sequence_ + 1, event);

    bool written = google::protobuf::util::SerializeDelimitedToOstream(entry, &out_);
    out_.flush();
    if (!written || !out_) {
        log_error("journal", "append_failed", {{"path", path_}, {"sequence", entry.sequence()}});
        // Cut any partial record so the next append starts on a record boundary.
        out_.close();
        std::error_code ec;
        std::filesystem::resize_file(path_, static_cast<uintmax_t>(size_), ec);
        out_.open(path_, std::ios::binary | std::ios::app);
        throw InventoryError::storage_failure("Journal append failed: " + path_);
    }

    size_ += static_cast<int64_t>(entry.ByteSizeLong()) +
             static_cast<int64_t>(google::protobuf::io::CodedOutputStream::VarintSize32(
                 static_cast<uint32_t>(entry.ByteSizeLong())));
    last_sequence_ = entry.sequence();
    return entry;
}

std::vector<events::JournalEntry> FileJournal::read_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load(nullptr);
}

uint64_t FileJournal::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sequence_;
}

std::vector<events::JournalEntry> FileJournal::load(int64_t* intact_bytes) const {
    std::vector<events::JournalEntry> entries;
    if (intact_bytes) *intact_bytes = 0;
    std::ifstream in(path_, std::ios::binary);
    if (!in) return entries;

    google::protobuf::io::IstreamInputStream input(&in);
    while (true) {
        events::JournalEntry entry;
        bool clean_eof = false;
        if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(&entry, &input, &clean_eof)) {
            if (!clean_eof) {
                // A torn tail from an interrupted append; everything before it is intact.
                log_warn("journal", "truncated_tail_ignored",
                    {{"path", path_}, {"entries_read", entries.size()}});
            }
            break;
        }
        if (intact_bytes) *intact_bytes = input.ByteCount();
        entries.push_back(std::move(entry));
    }
    return entries;
}

} // namespace floorstock
