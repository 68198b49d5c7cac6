#include "MessageBus.h"

#include <iterator>

namespace rhdispatch {

void MessageBus::post(const std::string& recipient, Delivery delivery)
{
    mailboxes[recipient].push_back(std::move(delivery));
}

bool MessageBus::deliver_one()
{
    if (mailboxes.empty())
        return false;

    auto it = mailboxes.begin();
    if (random_order && mailboxes.size() > 1)
    {
        std::uniform_int_distribution<size_t> pick(0, mailboxes.size() - 1);
        std::advance(it, pick(rng));
    }

    // pop before running: the delivery may post to the same mailbox
    Delivery delivery = std::move(it->second.front());
    it->second.pop_front();
    if (it->second.empty())
        mailboxes.erase(it);

    m_delivered_total++;
    delivery();
    return true;
}

long long MessageBus::pump(long long max_deliveries)
{
    long long n = 0;
    while ((max_deliveries < 0 || n < max_deliveries) && deliver_one())
        n++;
    return n;
}

size_t MessageBus::pending() const
{
    size_t n = 0;
    for (const auto& kv : mailboxes)
        n += kv.second.size();
    return n;
}

size_t MessageBus::pending_for(const std::string& recipient) const
{
    auto it = mailboxes.find(recipient);
    return it == mailboxes.end() ? 0 : it->second.size();
}

} // namespace rhdispatch
