// File: src/cli/batch_runner.hpp
//
// Batch job driver behind the itemrec_batch executable
// Kept separate from main() for testability

#ifndef ITEMREC_BATCH_RUNNER_HPP
#define ITEMREC_BATCH_RUNNER_HPP

#include "cli/pipeline_config.hpp"
#include "core/types.hpp"
#include "pipeline/recommendation_pipeline.hpp"
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace itemrec {

/// Parsed command-line options
struct BatchOptions {
    ModelType mode{ModelType::PAIRWISE};
    std::string input_path;
    std::string config_path;
    std::string db_path;     // Overrides output.database_path when set
    std::string csv_path;
    bool verbose{false};
    bool show_help{false};
};

/// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

/// Runs one batch: load config, read events, run a path, write sinks
class BatchRunner {
public:
    explicit BatchRunner(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    /// Execute with arguments (argv without the program name)
    /// @return process exit code
    int Run(const std::vector<std::string>& args);

    /// Parse arguments; on failure returns nullopt and fills error
    static std::optional<BatchOptions> ParseArgs(const std::vector<std::string>& args,
                                                 std::string& error);

    static void PrintUsage(std::ostream& out);

    /// Use a fixed updated_at instead of the current UTC time
    void SetGeneratedAt(const std::string& timestamp) { generated_at_ = timestamp; }

    /// Result of the last successful run (for verification)
    const std::optional<PipelineResult>& GetLastResult() const { return last_result_; }

private:
    std::ostream& out_;
    std::ostream& err_;
    std::string generated_at_;
    std::optional<PipelineResult> last_result_;

    int Execute(const BatchOptions& options);

    void ReportFailures(const RecommendationBatch& batch) const;
};

} // namespace itemrec

#endif // ITEMREC_BATCH_RUNNER_HPP
