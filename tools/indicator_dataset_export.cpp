// indicator_dataset_export — bars CSV in, engineered train/validation/test out
//
// Usage:
//   indicator_dataset_export --input bars.csv --output-dir out/ [options]
//
// Writes <dir>/{train,validation,test}.{csv|parquet}, <dir>/normalization.csv
// and <dir>/metadata.txt.

#include "bars/bar_csv.hpp"
#include "features/dataset_export.hpp"
#include "features/feature_engineer.hpp"
#include "features/normalization_io.hpp"
#include "features/parquet_export.hpp"
#include "indicators/indicator_pipeline.hpp"
#include "pipeline_config.hpp"
#include "pipeline_errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <bars.csv> --output-dir <dir> [options]\n"
              << "\n"
              << "  --input            Bar CSV: timestamp,open,high,low,close,volume\n"
              << "  --output-dir       Directory for segments, normalization and metadata\n"
              << "  --format           csv (default) or parquet\n"
              << "  --missing-policy   forward_fill (default) or drop\n"
              << "  --balance          oversample (default), weight or none\n"
              << "  --label-threshold  Minimum relative rise for an 'up' label (0.005)\n"
              << "  --imbalance-threshold  Minority proportion below which to rebalance (0.40)\n"
              << "  --split-ratios     train,validation,test fractions (0.70,0.15,0.15)\n"
              << "  --neighbors        Oversampling neighbors (5)\n"
              << "  --seed             Oversampling seed (42)\n"
              << "\n"
              << "  Indicator periods (defaults in parentheses):\n"
              << "  --atr (14) --sma-fast (20) --sma-slow (50) --bollinger (20)\n"
              << "  --bollinger-width (2.0) --rsi (14) --macd-fast (12) --macd-slow (26)\n"
              << "  --macd-signal (9) --stochastic (14) --stochastic-smoothing (3)\n"
              << "  --adx (14) --cci (20)\n"
              << "\n"
              << "  --parallel         Evaluate calculators concurrently\n"
              << "  --verbose          Debug logging\n";
}

struct CliArgs {
    std::string input;
    std::string output_dir;
    std::string format = "csv";
    PipelineConfig pipeline;
    FeatureConfig features;
    bool verbose = false;
};

const std::vector<std::string> PERIOD_FLAGS = {
    "--atr", "--sma-fast", "--sma-slow", "--bollinger", "--bollinger-width",
    "--rsi", "--macd-fast", "--macd-slow", "--macd-signal", "--stochastic",
    "--stochastic-smoothing", "--adx", "--cci"};

bool is_period_flag(const std::string& arg) {
    return std::find(PERIOD_FLAGS.begin(), PERIOD_FLAGS.end(), arg) != PERIOD_FLAGS.end();
}

// "--sma-fast" -> "sma_fast"
std::string period_name(const std::string& flag) {
    std::string name = flag.substr(2);
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

// Returns false (after printing the reason) on any parse error.
bool parse_args(int argc, char* argv[], CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--input" && has_value) {
            args.input = argv[++i];
        } else if (arg == "--output-dir" && has_value) {
            args.output_dir = argv[++i];
        } else if (arg == "--format" && has_value) {
            args.format = argv[++i];
        } else if (arg == "--missing-policy" && has_value) {
            args.pipeline.missing_value_policy = parse_missing_value_policy(argv[++i]);
        } else if (arg == "--balance" && has_value) {
            args.features.balance_strategy = parse_balance_strategy(argv[++i]);
        } else if (arg == "--label-threshold" && has_value) {
            args.features.label_threshold = std::stod(argv[++i]);
        } else if (arg == "--imbalance-threshold" && has_value) {
            args.features.imbalance_threshold = std::stod(argv[++i]);
        } else if (arg == "--split-ratios" && has_value) {
            args.features.split_ratios = parse_split_ratios(argv[++i]);
        } else if (arg == "--neighbors" && has_value) {
            args.features.oversample_neighbors = std::stoi(argv[++i]);
        } else if (is_period_flag(arg) && has_value) {
            set_indicator_period(args.pipeline.periods, period_name(arg), argv[++i]);
        } else if (arg == "--seed" && has_value) {
            args.features.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--parallel") {
            args.pipeline.parallel = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return false;
        }
    }

    if (args.input.empty()) {
        std::cerr << "Missing required argument: --input\n";
        return false;
    }
    if (args.output_dir.empty()) {
        std::cerr << "Missing required argument: --output-dir\n";
        return false;
    }
    validate_periods(args.pipeline.periods);
    validate_config(args.features);
    if (args.format != "csv" && args.format != "parquet") {
        std::cerr << "Unsupported format '" << args.format << "'. Use csv or parquet.\n";
        return false;
    }
    return true;
}

}  // anonymous namespace

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    CliArgs args;
    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::logic_error& e) {   // number, option-name and config validation
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        std::filesystem::create_directories(args.output_dir);

        BarSequence bars = load_bars_csv(args.input);
        IndicatorPipeline pipeline(args.pipeline);
        FeatureTable table = pipeline.compute_all(bars);

        FeatureEngineer engineer(pipeline.indicator_columns(), args.features);
        EngineeredDataset data = engineer.prepare(table);

        std::vector<std::string> written;
        if (args.format == "parquet") {
            written = export_dataset_parquet(args.output_dir, data);
        } else {
            written = SegmentExporter::export_dataset(args.output_dir, data);
        }

        std::filesystem::path dir(args.output_dir);
        std::string norm_path = (dir / "normalization.csv").string();
        save_normalization_state(norm_path, data.normalization);
        written.push_back(norm_path);

        std::string meta_path = (dir / "metadata.txt").string();
        std::ofstream meta(meta_path);
        if (!meta.is_open()) {
            std::cerr << "Cannot open output file: " << meta_path << "\n";
            return 1;
        }
        write_metadata(meta, data.metadata);
        written.push_back(meta_path);

        std::cout << "Rows: train=" << data.train.rows()
                  << " (" << data.metadata.n_synthetic << " synthetic)"
                  << " validation=" << data.validation.rows()
                  << " test=" << data.test.rows() << "\n";
        for (const auto& p : written) std::cout << "  wrote " << p << "\n";
    } catch (const InsufficientHistoryError& e) {
        std::cerr << "Not enough bars: " << e.what() << "\n";
        return 2;
    } catch (const FeaturePipelineError& e) {
        std::cerr << "Pipeline error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
