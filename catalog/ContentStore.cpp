#include "catalog/ContentStore.hpp"
#include "catalog/Environment.hpp"
#include "catalog/Fingerprint.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace catalog {

ContentStore::ContentStore(const Environment &env, account_t author, std::string title, genre_t genre, std::string bytes)
    : env_(env), bytes_{std::move(bytes)}
{
    info_.author = author;
    info_.title = std::move(title);
    info_.genre = genre;
    info_.fingerprint = fingerprint(bytes_);
}

ContentManager::Info ContentStore::info() const {
    return info_;
}

bool ContentStore::hasAccess(account_t account) const {
    auto found = grants_.find(account);
    return found != grants_.end() and found->second >= env_.now();
}

void ContentStore::grantAccess(account_t account, timestamp_t until) {
    if (hasAccess(account))
        throw std::runtime_error("ContentStore: account " + std::to_string(account) + " already has access to \"" + info_.title + "\"");
    grants_[account] = until;
}

const std::string& ContentStore::consume(account_t account) {
    if (not hasAccess(account))
        throw std::runtime_error("ContentStore: account " + std::to_string(account) + " has no access to \"" + info_.title + "\"");
    grants_.erase(account);
    consumed_++;
    return bytes_;
}

}
