#pragma once

#include "bars/bar.hpp"
#include "features/feature_table.hpp"
#include "features/missing_values.hpp"
#include "indicators/directional.hpp"
#include "indicators/indicator_calculator.hpp"
#include "indicators/moving_average.hpp"
#include "indicators/oscillators.hpp"
#include "indicators/volatility.hpp"
#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// IndicatorPipeline — fans bars out to every calculator, joins by row index
//
// Output columns: Open, High, Low, Close, Volume, then each calculator's
// columns in registration order. Parallel and serial runs join in the same
// order and produce identical tables.
// ---------------------------------------------------------------------------
class IndicatorPipeline {
public:
    IndicatorPipeline() : IndicatorPipeline(PipelineConfig{}) {}

    explicit IndicatorPipeline(const PipelineConfig& config) : config_(config) {
        validate_periods(config_.periods);
        const auto& p = config_.periods;
        calculators_.push_back(std::make_unique<AtrCalculator>(p.atr));
        calculators_.push_back(std::make_unique<SmaCalculator>(p.sma_fast, p.sma_slow));
        calculators_.push_back(
            std::make_unique<BollingerBandsCalculator>(p.bollinger, p.bollinger_width));
        calculators_.push_back(std::make_unique<RsiCalculator>(p.rsi));
        calculators_.push_back(
            std::make_unique<MacdCalculator>(p.macd_fast, p.macd_slow, p.macd_signal));
        calculators_.push_back(
            std::make_unique<StochasticCalculator>(p.stochastic, p.stochastic_smoothing));
        calculators_.push_back(std::make_unique<AdxCalculator>(p.adx));
        calculators_.push_back(std::make_unique<CciCalculator>(p.cci));
    }

    const PipelineConfig& config() const { return config_; }

    // Names of every indicator column, in table order.
    std::vector<std::string> indicator_columns() const {
        std::vector<std::string> names;
        for (const auto& calc : calculators_) {
            for (auto& n : calc->column_names()) names.push_back(std::move(n));
        }
        return names;
    }

    // Throws InsufficientHistoryError listing every calculator that is short.
    void check_history(const BarSequence& bars) const {
        std::vector<HistoryShortfall> shortfalls;
        for (const auto& calc : calculators_) {
            if (bars.size() < calc->required_bars()) {
                shortfalls.push_back({calc->name(), calc->required_bars()});
            }
        }
        if (!shortfalls.empty()) {
            throw InsufficientHistoryError(std::move(shortfalls), bars.size());
        }
    }

    // Indicator columns with NaN warm-up rows intact, joined to OHLCV.
    FeatureTable compute_raw(const BarSequence& bars) const {
        check_history(bars);

        std::vector<std::vector<IndicatorColumn>> outputs;
        outputs.reserve(calculators_.size());
        if (config_.parallel) {
            std::vector<std::future<std::vector<IndicatorColumn>>> pending;
            pending.reserve(calculators_.size());
            for (const auto& calc : calculators_) {
                const IndicatorCalculator* c = calc.get();
                pending.push_back(std::async(std::launch::async,
                                             [c, &bars] { return c->compute(bars); }));
            }
            // get() rethrows a calculator's exception; joining in order keeps
            // the column layout identical to the serial path.
            for (auto& f : pending) outputs.push_back(f.get());
        } else {
            for (const auto& calc : calculators_) outputs.push_back(calc->compute(bars));
        }

        FeatureTable table = ohlcv_table(bars);
        for (auto& cols : outputs) {
            for (auto& col : cols) table.add_column(col.name, std::move(col.values));
        }
        return table;
    }

    // Full feature table after the configured missing-value policy.
    FeatureTable compute_all(const BarSequence& bars) const {
        spdlog::info("IndicatorPipeline: computing {} calculators over {} bars ({})",
                     calculators_.size(), bars.size(),
                     config_.parallel ? "parallel" : "serial");
        FeatureTable raw = compute_raw(bars);
        FeatureTable table = apply_missing_value_policy(raw, config_.missing_value_policy);
        spdlog::info("IndicatorPipeline: {} rows x {} columns after {}",
                     table.rows(), table.cols(),
                     policy_name(config_.missing_value_policy));
        return table;
    }

    static FeatureTable ohlcv_table(const BarSequence& bars) {
        std::vector<int64_t> ts;
        std::vector<double> open, high, low, close, volume;
        ts.reserve(bars.size());
        for (const auto& b : bars) {
            ts.push_back(b.timestamp);
            open.push_back(b.open);
            high.push_back(b.high);
            low.push_back(b.low);
            close.push_back(b.close);
            volume.push_back(static_cast<double>(b.volume));
        }
        FeatureTable table(std::move(ts));
        const auto& names = ohlcv_column_names();
        table.add_column(names[0], std::move(open));
        table.add_column(names[1], std::move(high));
        table.add_column(names[2], std::move(low));
        table.add_column(names[3], std::move(close));
        table.add_column(names[4], std::move(volume));
        return table;
    }

private:
    PipelineConfig config_;
    std::vector<std::unique_ptr<IndicatorCalculator>> calculators_;
};
