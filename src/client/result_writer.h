#ifndef FIREHOSE_CLIENT_RESULT_WRITER_H_
#define FIREHOSE_CLIENT_RESULT_WRITER_H_

#include <string>

#include "simulator.h"

namespace Firehose {

struct RunParameters {
    int num_clients = 1;
    double target_rate = kDefaultTargetRate;
    double duration_s = kDefaultDurationSec;
    size_t unit_size = kUnitSize;
    size_t batch_size = kBatchSize;
};

/**
 * Appends one CSV row per client run to <data_dir>/throughput/result.csv.
 * The row is written on destruction, after SetSummary() was called.
 */
class ResultWriter {
public:
    /**
     * @param record Nothing is written when false
     * @param data_dir Base data directory (config results.dir)
     */
    ResultWriter(const RunParameters& params, bool record, const std::string& data_dir);

    /**
     * Destructor - writes results to file
     */
    ~ResultWriter();

    void SetSummary(const SummaryStats& summary);

    const std::string& result_path() const { return result_path_; }

private:
    RunParameters params_;
    bool record_result_;
    bool has_summary_ = false;
    SummaryStats summary_;
    std::string result_path_;
};

} // namespace Firehose

#endif // FIREHOSE_CLIENT_RESULT_WRITER_H_
