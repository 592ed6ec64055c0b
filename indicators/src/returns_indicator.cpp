#include "returns_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <vector>
#include <stdexcept>

namespace indicators {

TaLibSession::TaLibSession() {
    TA_RetCode ret_code = TA_Initialize();
    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_Initialize failed with error code: {}", static_cast<int>(ret_code)));
    }
}

TaLibSession::~TaLibSession() {
    TA_Shutdown();
}

ReturnsIndicator::ReturnsIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("ROCP period must be positive.");
    }

    lookback_ = TA_ROCP_Lookback(period_);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_ROCP_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("ROCP({})", period_);
    core::logging::getLogger()->trace("ReturnsIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string ReturnsIndicator::getName() const {
    return name_;
}

int ReturnsIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& ReturnsIndicator::getResult() const {
    return results_;
}

void ReturnsIndicator::calculate(const core::TimeSeries<double>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->trace("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    int output_size = static_cast<int>(input.size()) - lookback_;
    results_.resize(static_cast<size_t>(output_size));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_ROCP(
        0,                                     // startIdx
        static_cast<int>(input.size()) - 1,    // endIdx
        input.data(),                          // inReal
        period_,                               // optInTimePeriod
        &out_begin_idx,                        // outBegIdx
        &out_nb_element,                       // outNbElement
        results_.data()                        // outReal
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_ROCP calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
         logger->warn("TA_ROCP out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                      out_begin_idx, lookback_, name_);
    }
    if (out_nb_element != output_size) {
         logger->warn("TA_ROCP out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results vector.",
                      out_nb_element, output_size, name_);
         results_.resize(static_cast<size_t>(out_nb_element));
    }
}

} // namespace indicators
