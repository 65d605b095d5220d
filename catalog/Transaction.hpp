#pragma once
#include "catalog/Event.hpp"
#include <eris/noncopyable.hpp>
#include <cstddef>
#include <functional>
#include <vector>

namespace catalog {

class Transaction;

/** Keeps track of the open transaction frames of one catalog, buffers the events they emit, and
 * delivers committed events to subscribers.
 */
class Journal : private eris::noncopyable {
    public:
        /// Callback type for event subscribers
        using Listener = std::function<void(const Event&)>;

        /// Creates a journal with no open frames and no subscribers.
        Journal() = default;

        /** Adds a subscriber.  Subscribers are called, in subscription order, for every event of an
         * operation once that operation has completely committed.  Subscribers must not call back
         * into the catalog.  A subscriber that throws fails the operation: its changes are rolled
         * back and the exception propagates to the caller, although subscribers called before it
         * have already seen the events.
         */
        void subscribe(Listener listener);

        /// The number of currently open frames: 0 between operations, above 1 during a re-entrant call.
        size_t depth() const { return frames_.size(); }

    private:
        friend class Transaction;
        std::vector<Transaction*> frames_;
        std::vector<Event> pending_;
        std::vector<Listener> listeners_;
};

/** An all-or-nothing frame around a single catalog operation.
 *
 * Every field an operation changes is recorded with save() (or an explicit onRollback() action)
 * *before* it is changed.  If the frame is destroyed without commit() having been called (which is
 * what happens when the operation throws), the recorded actions are replayed in reverse order,
 * restoring the state as it was when the frame opened, and the events emitted in the frame are
 * dropped.
 *
 * Frames nest: an operation invoked re-entrantly (from a content manager or a payee while another
 * operation is waiting on it) opens its own frame.  If the inner frame fails, only its own changes
 * are undone.  If it commits, its undo actions and events are handed to the enclosing frame, so
 * that a later failure of the outer operation undoes the inner one as well.  Events reach the
 * subscribers only when the outermost frame commits.
 */
class Transaction : private eris::noncopyable {
    public:
        /// Opens a new frame in the given journal.
        explicit Transaction(Journal &journal);

        /// Rolls the frame back unless it was committed.
        ~Transaction();

        /** Records the current value of `field` so that it is restored on rollback.  `field` must
         * stay at the same address for the lifetime of the frame.
         */
        template <typename T>
        void save(T &field) {
            T *ptr = &field;
            T old = field;
            undo_.push_back([ptr, old] { *ptr = old; });
        }

        /** Records an arbitrary undo action, for changes save() can't express (such as inserting
         * into a container).  The action must not throw.
         */
        void onRollback(std::function<void()> undo);

        /// Emits an event, to be delivered when the outermost frame commits.
        void emit(Event event);

        /** Commits the frame.  For the outermost frame this delivers the buffered events to the
         * journal's subscribers, and the frame only counts as committed once they have all
         * returned; for a nested frame the undo actions and events pass to the enclosing frame.
         */
        void commit();

        /// Returns true if this frame is open inside another one.
        bool nested() const { return depth_ > 1; }

    private:
        Journal &journal_;
        size_t depth_;
        size_t event_mark_;
        std::vector<std::function<void()>> undo_;
        bool committed_ = false;
};

}
