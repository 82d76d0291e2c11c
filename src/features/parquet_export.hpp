#pragma once

#include "features/feature_engineer.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Parquet export — same columns as the CSV segments, ZSTD compressed
//
//   timestamp INT64, <features> DOUBLE, label INT64, weight DOUBLE,
//   synthetic BOOLEAN
// ---------------------------------------------------------------------------
namespace parquet_export_detail {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

inline std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& b, const std::string& column) {
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "Failed to build column '" + column + "'");
    return arr;
}

}  // namespace parquet_export_detail

inline std::shared_ptr<arrow::Table> segment_to_arrow(const DatasetSegment& seg) {
    using parquet_export_detail::check;
    using parquet_export_detail::finish;

    arrow::FieldVector fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    fields.push_back(arrow::field("timestamp", arrow::int64()));
    {
        arrow::Int64Builder b;
        check(b.AppendValues(seg.features.timestamps()), "timestamp");
        arrays.push_back(finish(b, "timestamp"));
    }

    const auto& names = seg.features.column_names();
    for (size_t c = 0; c < seg.features.cols(); ++c) {
        fields.push_back(arrow::field(names[c], arrow::float64()));
        const auto& values = seg.features.column(c);
        arrow::DoubleBuilder b;
        check(b.AppendValues(values.data(), static_cast<int64_t>(values.size())), names[c]);
        arrays.push_back(finish(b, names[c]));
    }

    fields.push_back(arrow::field("label", arrow::int64()));
    {
        arrow::Int64Builder b;
        for (int l : seg.labels) check(b.Append(l), "label");
        arrays.push_back(finish(b, "label"));
    }

    fields.push_back(arrow::field("weight", arrow::float64()));
    {
        arrow::DoubleBuilder b;
        check(b.AppendValues(seg.weights.data(), static_cast<int64_t>(seg.weights.size())),
              "weight");
        arrays.push_back(finish(b, "weight"));
    }

    fields.push_back(arrow::field("synthetic", arrow::boolean()));
    {
        arrow::BooleanBuilder b;
        for (bool s : seg.synthetic) check(b.Append(s), "synthetic");
        arrays.push_back(finish(b, "synthetic"));
    }

    return arrow::Table::Make(arrow::schema(fields), arrays);
}

inline void export_segment_parquet(const std::string& path, const DatasetSegment& seg) {
    using parquet_export_detail::check;

    auto table = segment_to_arrow(seg);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, static_cast<int64_t>(seg.rows()));
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, chunk,
                                     props),
          "Failed to write Parquet " + path);
    check(outfile->Close(), "Failed to close " + path);
}

// Writes train.parquet, validation.parquet and test.parquet under `dir`.
inline std::vector<std::string> export_dataset_parquet(const std::string& dir,
                                                       const EngineeredDataset& data) {
    std::filesystem::path base(dir);
    std::vector<std::string> paths = {(base / "train.parquet").string(),
                                      (base / "validation.parquet").string(),
                                      (base / "test.parquet").string()};
    export_segment_parquet(paths[0], data.train);
    export_segment_parquet(paths[1], data.validation);
    export_segment_parquet(paths[2], data.test);
    return paths;
}
