#pragma once

#include "indicators.hpp" // Base interface
#include <string>

namespace indicators {

// Rate of change percentage, (price - prevPrice) / prevPrice, over `period` bars.
// A zero previous price yields a 0 return.
class ReturnsIndicator : public IIndicator {
public:
    explicit ReturnsIndicator(int period = 1);

    virtual ~ReturnsIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;              // TA-Lib lookback for ROCP
    std::string name_;          // e.g. "ROCP(1)"
    core::TimeSeries<double> results_;
};

} // namespace indicators
