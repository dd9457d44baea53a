#pragma once

#include <stdio.h>
#include <string>
#include "future_symbol.h"
#include "time_util.h"
#include "plcc/PLCC.hpp"

namespace md {

    enum TickType {
        Trade = 0,
        Quote = 1,
        OpenInterest = 2
    };

    inline
    static const char* getTickTypeStr(TickType type) {
        switch (type) {
        case Trade: return "Trade";
        case Quote: return "Quote";
        case OpenInterest: return "OpenInterest";
        default:
            return "???";
        }
    }

    /*
     * A normalized market event of one instrument.
     * Fields not used by the tick type stay at zero:
     *   Trade:        _value (price), _quantity
     *   Quote:        _value (price), one side of bid/ask, see _bid_set/_ask_set
     *   OpenInterest: _value (open interest), _exchange
     */
    struct Tick {
        FutureSymbol _symbol;
        long long _time_milli;  // feed local time, no time zone applied
        TickType _type;
        double _value;

        double _bid_price;
        long long _bid_size;
        double _ask_price;
        long long _ask_size;
        bool _bid_set;
        bool _ask_set;

        long long _quantity;
        std::string _exchange;

        Tick()
        : _time_milli(0), _type(Trade), _value(0),
          _bid_price(0), _bid_size(0), _ask_price(0), _ask_size(0),
          _bid_set(false), _ask_set(false), _quantity(0)
        {};

        std::string timeString() const {
            return utils::TimeUtil::milli_to_string(_time_milli);
        }

        // time, ticker, symbol, type, value, quantity, bid_px, bid_sz, ask_px, ask_sz, exchange
        std::string toCSVLine() const {
            char buf[512];
            snprintf(buf, sizeof(buf), "%s, %s, %s, %s, %s, %s, %s, %s, %s, %s, %s",
                    timeString().c_str(), _symbol._ticker.c_str(), _symbol.toString().c_str(),
                    getTickTypeStr(_type), PriceCString(_value),
                    (_type==Trade? std::to_string(_quantity).c_str():""),
                    (_bid_set? PriceCString(_bid_price):""),
                    (_bid_set? std::to_string(_bid_size).c_str():""),
                    (_ask_set? PriceCString(_ask_price):""),
                    (_ask_set? std::to_string(_ask_size).c_str():""),
                    _exchange.c_str());
            return std::string(buf);
        }
    };
}
