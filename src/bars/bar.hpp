#pragma once

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Bar — one OHLCV record for a fixed interval
// ---------------------------------------------------------------------------
struct Bar {
    int64_t timestamp = 0;   // strictly increasing across a sequence
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    uint64_t volume = 0;
};

// ---------------------------------------------------------------------------
// BarSequence — caller-owned, read-only input to the indicator pipeline
// ---------------------------------------------------------------------------
using BarSequence = std::vector<Bar>;

// Names of the raw OHLCV columns as they appear in a feature table.
inline const std::vector<std::string>& ohlcv_column_names() {
    static const std::vector<std::string> names = {
        "Open", "High", "Low", "Close", "Volume"};
    return names;
}

// True when high >= max(open, close) >= min(open, close) >= low.
inline bool has_valid_envelope(const Bar& bar) {
    double body_hi = bar.open > bar.close ? bar.open : bar.close;
    double body_lo = bar.open < bar.close ? bar.open : bar.close;
    return bar.high >= body_hi && body_lo >= bar.low && bar.low > 0.0;
}
