#include "catalog/Event.hpp"

namespace catalog {

Event Event::newAuthor(account_t author) {
    Event e(Type::new_author);
    e.account = author;
    return e;
}

Event Event::newContentPublished(content_t content, account_t author, const std::string &title, genre_t genre) {
    Event e(Type::new_content_published);
    e.content = content;
    e.account = author;
    e.title = title;
    e.genre = genre;
    return e;
}

Event Event::newPremiumSubscription(account_t account, timestamp_t expiration) {
    Event e(Type::new_premium_subscription);
    e.account = account;
    e.time = expiration;
    return e;
}

Event Event::contentGranted(content_t content, account_t account, timestamp_t until, bool premium) {
    Event e(Type::content_granted);
    e.content = content;
    e.account = account;
    e.time = until;
    e.premium = premium;
    return e;
}

Event Event::creditAvailable(account_t author) {
    Event e(Type::credit_available);
    e.account = author;
    return e;
}

Event Event::creditTransferred(account_t payee, amount_t amount) {
    Event e(Type::credit_transferred);
    e.account = payee;
    e.amount = amount;
    return e;
}

Event Event::catalogClosed(account_t owner, amount_t residual) {
    Event e(Type::catalog_closed);
    e.account = owner;
    e.amount = residual;
    return e;
}

const char* Event::typeName(Type type) {
    switch (type) {
        case Type::new_author: return "NewAuthor";
        case Type::new_content_published: return "NewContentPublished";
        case Type::new_premium_subscription: return "NewPremiumSubscription";
        case Type::content_granted: return "ContentGranted";
        case Type::credit_available: return "CreditAvailable";
        case Type::credit_transferred: return "CreditTransferred";
        case Type::catalog_closed: return "CatalogClosed";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream &out, const Event &e) {
    out << Event::typeName(e.type) << "(";
    switch (e.type) {
        case Event::Type::new_author:
        case Event::Type::credit_available:
            out << "account=" << e.account;
            break;
        case Event::Type::new_content_published:
            out << "content=" << e.content << ", author=" << e.account << ", title=\"" << e.title << "\", genre=" << e.genre;
            break;
        case Event::Type::new_premium_subscription:
            out << "account=" << e.account << ", expiration=" << e.time;
            break;
        case Event::Type::content_granted:
            out << "content=" << e.content << ", account=" << e.account << ", until=" << e.time << (e.premium ? ", premium" : "");
            break;
        case Event::Type::credit_transferred:
        case Event::Type::catalog_closed:
            out << "account=" << e.account << ", amount=" << e.amount;
            break;
    }
    return out << ")";
}

}
