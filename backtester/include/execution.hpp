#pragma once

#include <string>
#include "datatypes.hpp"

namespace backtester {

    // Turns an approved OrderIntent into a Fill. Implemented by the simulator (replay)
    // and by the live broker adapter; the replay driver only sees this interface.
    class IExecutionAdapter {
    public:
        virtual ~IExecutionAdapter() = default;

        virtual std::string getName() const = 0;

        // `bar` is the bar under replay when the order is executed.
        // Throws core::ExecutionException when the order cannot be filled.
        virtual core::Fill execute(const core::OrderIntent& intent, const core::Bar& bar) = 0;

        // True when intents decided on bar t must be executed on bar t+1
        virtual bool fillsOnNextBar() const { return false; }
    };

} // namespace backtester
