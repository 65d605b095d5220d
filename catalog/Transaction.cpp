#include "catalog/Transaction.hpp"
#include <eris/debug.hpp>
#include <stdexcept>
#include <utility>

namespace catalog {

void Journal::subscribe(Listener listener) {
    listeners_.push_back(std::move(listener));
}

Transaction::Transaction(Journal &journal)
    : journal_(journal), depth_{journal.frames_.size() + 1}, event_mark_{journal.pending_.size()}
{
    journal_.frames_.push_back(this);
}

Transaction::~Transaction() {
    if (not committed_) {
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) (*it)();
        journal_.pending_.erase(journal_.pending_.begin() + event_mark_, journal_.pending_.end());
        ERIS_DBG("rolled back frame at depth " << depth_ << " (" << undo_.size() << " changes)");
    }
    journal_.frames_.pop_back();
}

void Transaction::onRollback(std::function<void()> undo) {
    undo_.push_back(std::move(undo));
}

void Transaction::emit(Event event) {
    if (committed_) throw std::logic_error("Transaction: cannot emit an event from a committed frame");
    journal_.pending_.push_back(std::move(event));
}

void Transaction::commit() {
    if (committed_) throw std::logic_error("Transaction: commit() called twice");
    if (journal_.frames_.back() != this) throw std::logic_error("Transaction: only the innermost frame can commit");

    if (nested()) {
        committed_ = true;
        auto &parent = *journal_.frames_[depth_ - 2];
        for (auto &u : undo_) parent.undo_.push_back(std::move(u));
        undo_.clear();
        return;
    }

    // The frame stays open while subscribers run, so one that throws rolls the operation back
    for (const auto &e : journal_.pending_) {
        ERIS_DBG(e);
        for (const auto &listener : journal_.listeners_) listener(e);
    }
    journal_.pending_.clear();
    committed_ = true;
}

}
