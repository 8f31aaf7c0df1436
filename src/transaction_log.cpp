#include "floorstock/transaction_log.hpp"
#include "floorstock/helpers.hpp"
#include <mutex>

namespace floorstock {

events::Transaction TransactionLog::append(events::Transaction tx) {
    std::unique_lock lock(mutex_);
    if (!tx.has_created_at()) *tx.mutable_created_at() = helpers::now();
    tx.set_total_cost(tx.quantity() * tx.unit_cost());
    tx.clear_sequence();

    auto entry = journal_.append(tx);
    tx.set_sequence(entry.sequence());
    index_locked(tx);
    return tx;
}

void TransactionLog::apply_entry(const events::JournalEntry& entry) {
    if (!helpers::holds<events::Transaction>(entry.event())) return;
    events::Transaction tx;
    if (!entry.event().UnpackTo(&tx)) return;
    tx.set_sequence(entry.sequence());

    std::unique_lock lock(mutex_);
    index_locked(std::move(tx));
}

std::vector<events::Transaction> TransactionLog::all() const {
    std::shared_lock lock(mutex_);
    return transactions_;
}

std::vector<events::Transaction> TransactionLog::for_item(const std::string& sku) const {
    return collect(by_item_, sku);
}

std::vector<events::Transaction> TransactionLog::for_pick_list(const std::string& pick_list_id) const {
    return collect(by_pick_list_, pick_list_id);
}

std::vector<events::Transaction> TransactionLog::for_order(const std::string& order_id) const {
    return collect(by_order_, order_id);
}

std::vector<events::Transaction> TransactionLog::for_key(
    const std::string& sku, const std::string& location) const {
    std::vector<events::Transaction> result;
    for (auto& tx : for_item(sku)) {
        if (tx.from_location() == location || tx.to_location() == location) {
            result.push_back(std::move(tx));
        }
    }
    return result;
}

size_t TransactionLog::size() const {
    std::shared_lock lock(mutex_);
    return transactions_.size();
}

void TransactionLog::index_locked(events::Transaction tx) {
    size_t position = transactions_.size();
    by_item_[tx.sku()].push_back(position);
    if (!tx.pick_list_id().empty()) by_pick_list_[tx.pick_list_id()].push_back(position);
    if (!tx.order_id().empty()) by_order_[tx.order_id()].push_back(position);
    transactions_.push_back(std::move(tx));
}

std::vector<events::Transaction> TransactionLog::collect(
    const std::unordered_map<std::string, std::vector<size_t>>& index,
    const std::string& key) const {
    std::shared_lock lock(mutex_);
    std::vector<events::Transaction> result;
    auto it = index.find(key);
    if (it == index.end()) return result;
    result.reserve(it->second.size());
    for (size_t position : it->second) {
        result.push_back(transactions_[position]);
    }
    return result;
}

} // namespace floorstock
