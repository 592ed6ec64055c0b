#pragma once

#include "datatypes.hpp" // Needs TimeSeries
#include <string>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "ROCP(1)")
    virtual std::string getName() const = 0;

    // Number of initial input points consumed before the first valid output
    virtual int getLookback() const = 0;

    // Calculate the indicator over a price series and store the result internally
    virtual void calculate(const core::TimeSeries<double>& input) = 0;

    // Calculated results. Size is input size minus lookback; caller aligns by lookback.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Owns TA-Lib's global state for the lifetime of the process scope that creates it
class TaLibSession {
public:
    TaLibSession();
    ~TaLibSession();

    TaLibSession(const TaLibSession&) = delete;
    TaLibSession& operator=(const TaLibSession&) = delete;
};

} // namespace indicators
