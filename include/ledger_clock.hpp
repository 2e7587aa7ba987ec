#pragma once

#include "token_amount.hpp"

#include <chrono>
#include <stdexcept>

namespace hm {

// Source of the transaction timestamp ("block time").
class LedgerClock {
public:
    virtual ~LedgerClock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public LedgerClock {
public:
    Timestamp now() const override {
        auto since = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(since).count());
    }
};

class ManualClock : public LedgerClock {
public:
    explicit ManualClock(Timestamp start) : now_(start) {}

    Timestamp now() const override { return now_; }
    void set(Timestamp t) { now_ = t; }
    void advance(Timestamp seconds) {
        if (now_ > kMaxAmount - seconds) {
            throw std::overflow_error("clock overflow");
        }
        now_ += seconds;
    }

private:
    Timestamp now_;
};

} // namespace hm
