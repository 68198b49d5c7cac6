#pragma once
// inc/MessageBus.h
//
// In-process stand-in for an actor runtime. Every recipient owns a FIFO
// mailbox; delivery picks a random non-empty mailbox, so messages to one
// recipient keep their order while messages to different recipients
// interleave arbitrarily.

#include <deque>
#include <functional>
#include <map>
#include <random>
#include <string>

namespace rhdispatch {

class MessageBus
{
public:
    typedef std::function<void()> Delivery;

    // false delivers mailboxes in recipient-name order (useful for tracing)
    bool random_order = true;

    explicit MessageBus(unsigned seed = 0) : rng(seed) {}

    void seed(unsigned s) { rng.seed(s); }

    void post(const std::string& recipient, Delivery delivery);

    // delivers one message; false when every mailbox is empty
    bool deliver_one();
    // delivers until quiescent or max_deliveries reached; returns the count
    long long pump(long long max_deliveries = -1);

    bool empty() const { return mailboxes.empty(); }
    size_t pending() const;
    size_t pending_for(const std::string& recipient) const;

    long long delivered() const { return m_delivered_total; }

private:
    std::map<std::string, std::deque<Delivery>> mailboxes;
    std::mt19937 rng;
    long long m_delivered_total = 0;
};

} // namespace rhdispatch
