#include "catalog/LocalChain.hpp"
#include "catalog/ContentManager.hpp"
#include <eris/debug.hpp>
#include <stdexcept>
#include <string>

namespace catalog {

LocalChain::LocalChain(timestamp_t start) : now_{start} {}

timestamp_t LocalChain::now() const {
    return now_;
}

void LocalChain::setTime(timestamp_t t) {
    if (t < now_) throw std::logic_error("LocalChain: time cannot go backwards");
    now_ = t;
}

void LocalChain::advance(timestamp_t seconds) {
    now_ += seconds;
}

account_t LocalChain::createAccount(amount_t balance) {
    account_t id = next_id_++;
    balances_[id] = balance;
    return id;
}

amount_t& LocalChain::account(account_t a) {
    auto found = balances_.find(a);
    if (found == balances_.end()) throw std::out_of_range("LocalChain: account " + std::to_string(a) + " does not exist");
    return found->second;
}

amount_t LocalChain::balance(account_t a) const {
    auto found = balances_.find(a);
    if (found == balances_.end()) throw std::out_of_range("LocalChain: account " + std::to_string(a) + " does not exist");
    return found->second;
}

content_t LocalChain::deploy(std::shared_ptr<ContentManager> manager) {
    if (not manager) throw std::invalid_argument("LocalChain: cannot deploy a null content manager");
    content_t id = next_id_++;
    managers_.emplace(id, std::move(manager));
    return id;
}

ContentManager& LocalChain::contentManager(content_t content) {
    auto found = managers_.find(content);
    if (found == managers_.end()) throw std::out_of_range("LocalChain: nothing is deployed at " + std::to_string(content));
    return *found->second;
}

void LocalChain::setCatalogAccount(account_t a) {
    account(a);
    catalog_account_ = a;
}

void LocalChain::onReceive(account_t a, ReceiveHook hook) {
    account(a);
    if (hook) hooks_[a] = std::move(hook);
    else hooks_.erase(a);
}

void LocalChain::move(account_t from, account_t to, amount_t amount) {
    auto &src = account(from);
    auto &dst = account(to);
    if (src < amount)
        throw std::runtime_error("LocalChain: account " + std::to_string(from) + " cannot pay " + std::to_string(amount)
                + " (balance " + std::to_string(src) + ")");
    src -= amount;
    dst += amount;
    moves_.push_back({from, to, amount});
}

void LocalChain::revert(size_t mark) {
    while (moves_.size() > mark) {
        const Move &m = moves_.back();
        balances_[m.to] -= m.amount;
        balances_[m.from] += m.amount;
        moves_.pop_back();
    }
}

void LocalChain::transfer(account_t to, amount_t amount) {
    if (catalog_account_ == 0) throw std::logic_error("LocalChain: transfer() called before setCatalogAccount()");
    const size_t mark = moves_.size();
    frames_++;
    try {
        move(catalog_account_, to, amount);
        auto hook = hooks_.find(to);
        if (hook != hooks_.end()) {
            // Copied: the hook may replace itself
            ReceiveHook h = hook->second;
            h(amount);
        }
    }
    catch (...) {
        revert(mark);
        frames_--;
        throw;
    }
    if (--frames_ == 0) moves_.clear();
}

void LocalChain::execute(account_t caller, amount_t value, const std::function<void()> &call) {
    if (catalog_account_ == 0) throw std::logic_error("LocalChain: execute() called before setCatalogAccount()");
    const size_t mark = moves_.size();
    frames_++;
    try {
        move(caller, catalog_account_, value);
        call();
    }
    catch (...) {
        ERIS_DBG("call from " << caller << " failed; reverting " << moves_.size() - mark << " balance movements");
        revert(mark);
        frames_--;
        throw;
    }
    if (--frames_ == 0) moves_.clear();
}

amount_t LocalChain::totalSupply() const {
    amount_t total = 0;
    for (const auto &b : balances_) total += b.second;
    return total;
}

}
