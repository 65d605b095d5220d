#include "catalog/ContentRegistry.hpp"
#include "catalog/CatalogError.hpp"
#include "catalog/ContentManager.hpp"
#include "catalog/Environment.hpp"
#include "catalog/Event.hpp"
#include "catalog/Transaction.hpp"
#include <eris/debug.hpp>
#include <algorithm>
#include <exception>
#include <string>

namespace catalog {

using Reason = CatalogError::Reason;

ContentRegistry::ContentRegistry(state::Ledger &ledger, Environment &env) : ledger_(ledger), env_(env) {}

void ContentRegistry::publish(Transaction &tx, account_t caller, content_t content) {
    ContentManager::Info meta;
    try {
        meta = env_.contentManager(content).info();
    }
    catch (const std::exception &e) {
        throw CatalogError(Reason::external_call_failed,
                "publish: unable to query content " + std::to_string(content) + ": " + e.what());
    }

    if (meta.author != caller)
        throw CatalogError(Reason::permission_denied, "publish: only the author of content " + std::to_string(content) + " can publish it");

    // Checked independently: a manager could report a fingerprint that doesn't match its own
    // reference, and the same bytes must never be paid for twice under different references.
    if (ledger_.fingerprints.count(meta.fingerprint))
        throw CatalogError(Reason::duplicate_content, "publish: content with this fingerprint has already been published");
    if (published(content))
        throw CatalogError(Reason::duplicate_content, "publish: content " + std::to_string(content) + " has already been published");

    ledger_.contents.emplace_back(content, meta.author, meta.genre);
    ledger_.content_index.emplace(content, ledger_.contents.size() - 1);
    ledger_.fingerprints.insert(meta.fingerprint);
    auto &ledger = ledger_;
    auto fp = meta.fingerprint;
    tx.onRollback([&ledger, content, fp] {
        ledger.fingerprints.erase(fp);
        ledger.content_index.erase(content);
        ledger.contents.pop_back();
    });

    if (not ledger_.authors[meta.author].registered) {
        ledger_.authors[meta.author].registered = true;
        ledger_.author_order.push_back(meta.author);
        account_t author = meta.author;
        tx.onRollback([&ledger, author] {
            ledger.author_order.pop_back();
            ledger.authors.erase(author);
        });
        tx.emit(Event::newAuthor(meta.author));
    }

    tx.emit(Event::newContentPublished(content, meta.author, meta.title, meta.genre));
    ERIS_DBG("published content " << content << " by author " << meta.author << " (genre " << meta.genre << ")");
}

bool ContentRegistry::published(content_t content) const {
    return ledger_.content_index.count(content) > 0;
}

const state::ContentInfo& ContentRegistry::info(content_t content) const {
    auto found = ledger_.content_index.find(content);
    if (found == ledger_.content_index.end())
        throw CatalogError(Reason::content_not_found, "content " + std::to_string(content) + " has not been published");
    return ledger_.contents[found->second];
}

state::ContentInfo& ContentRegistry::info(content_t content) {
    return const_cast<state::ContentInfo&>(static_cast<const ContentRegistry&>(*this).info(content));
}

size_t ContentRegistry::size() const {
    return ledger_.contents.size();
}

std::vector<content_t> ContentRegistry::contentList() const {
    std::vector<content_t> list;
    list.reserve(ledger_.contents.size());
    for (const auto &c : ledger_.contents) list.push_back(c.content);
    return list;
}

ContentRegistry::Statistics ContentRegistry::statistics() const {
    Statistics stats;
    stats.contents.reserve(ledger_.contents.size());
    stats.views.reserve(ledger_.contents.size());
    for (const auto &c : ledger_.contents) {
        stats.contents.push_back(c.content);
        stats.views.push_back(c.views);
    }
    return stats;
}

std::vector<content_t> ContentRegistry::newContentList(size_t n) const {
    std::vector<content_t> list;
    list.reserve(std::min(n, ledger_.contents.size()));
    for (auto it = ledger_.contents.rbegin(); it != ledger_.contents.rend() and list.size() < n; ++it)
        list.push_back(it->content);
    return list;
}

template <typename Pred>
content_t ContentRegistry::latest(Pred pred) const {
    for (auto it = ledger_.contents.rbegin(); it != ledger_.contents.rend(); ++it) {
        if (pred(*it)) return it->content;
    }
    return 0;
}

template <typename Pred>
content_t ContentRegistry::mostPopular(Pred pred) const {
    content_t best = 0;
    uint64_t best_views = 0;
    for (const auto &c : ledger_.contents) {
        if (pred(c) and c.views >= best_views) {
            best = c.content;
            best_views = c.views;
        }
    }
    return best;
}

content_t ContentRegistry::latestByGenre(genre_t genre) const {
    return latest([genre](const state::ContentInfo &c) { return c.genre == genre; });
}

content_t ContentRegistry::latestByAuthor(account_t author) const {
    return latest([author](const state::ContentInfo &c) { return c.author == author; });
}

content_t ContentRegistry::mostPopularByGenre(genre_t genre) const {
    return mostPopular([genre](const state::ContentInfo &c) { return c.genre == genre; });
}

content_t ContentRegistry::mostPopularByAuthor(account_t author) const {
    return mostPopular([author](const state::ContentInfo &c) { return c.author == author; });
}

}
