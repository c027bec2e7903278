#include "result_writer.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace fs = std::filesystem;

namespace Firehose {

ResultWriter::ResultWriter(const RunParameters& params, bool record, const std::string& data_dir)
    : params_(params),
      record_result_(record) {
    std::string base = data_dir.empty() ? "./" : data_dir;
    if (base.back() != '/') {
        base += '/';
    }
    result_path_ = base + "throughput/";

    if (!record_result_) {
        result_path_ += "result.csv";
        return;
    }

    // Create output directory if it doesn't exist
    try {
        fs::create_directories(result_path_);
    } catch (const fs::filesystem_error& e) {
        LOG(ERROR) << "Failed to create result directory: " << e.what();
    }

    result_path_ += "result.csv";

    std::error_code ec;
    bool headers_needed = !fs::exists(result_path_, ec) || fs::file_size(result_path_, ec) == 0;
    if (!headers_needed) {
        return;
    }

    std::ofstream header_file(result_path_);
    if (!header_file.is_open()) {
        LOG(ERROR) << "Failed to create result file: " << result_path_ << ": " << strerror(errno);
        return;
    }

    header_file << "num_clients,"
                << "target_rate,"
                << "duration_s,"
                << "unit_size,"
                << "batch_size,"
                << "total_packets,"
                << "total_bytes,"
                << "total_errors,"
                << "avg_rate_per_client,"
                << "total_rate\n";
    header_file.close();

    LOG(INFO) << "Created new result file with headers: " << result_path_;
}

ResultWriter::~ResultWriter() {
    if (!record_result_ || !has_summary_) {
        return;
    }

    std::ofstream file(result_path_, std::ios::app);
    if (!file.is_open()) {
        LOG(ERROR) << "Error: Could not open file: " << result_path_ << " : " << strerror(errno);
        return;
    }

    auto formatFloat = [](double value) -> std::string {
        if (value == 0.0) return "0";
        std::stringstream ss;
        ss << std::fixed << std::setprecision(4) << value;
        return ss.str();
    };

    file << params_.num_clients << ","
         << formatFloat(params_.target_rate) << ","
         << formatFloat(params_.duration_s) << ","
         << params_.unit_size << ","
         << params_.batch_size << ","
         << summary_.total_packets << ","
         << summary_.total_bytes << ","
         << summary_.total_errors << ","
         << formatFloat(summary_.avg_rate_per_client) << ","
         << formatFloat(summary_.total_rate) << "\n";
    file.close();

    LOG(INFO) << "Results written to: " << result_path_;
}

void ResultWriter::SetSummary(const SummaryStats& summary) {
    summary_ = summary;
    has_summary_ = true;
}

} // namespace Firehose
