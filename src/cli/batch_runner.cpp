// File: src/cli/batch_runner.cpp
//
// Batch job driver implementation

#include "cli/batch_runner.hpp"
#include "output/output_assembler.hpp"
#include "storage/event_reader.hpp"
#include "storage/recommendation_store.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace itemrec {

namespace {

// Failures listed individually before the summary line takes over
constexpr size_t kMaxListedFailures = 10;

} // namespace

BatchRunner::BatchRunner(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {
}

void BatchRunner::PrintUsage(std::ostream& out) {
    out << "Usage: itemrec_batch --mode pairwise|itemset --input <events.csv>\n"
        << "                     [--config <file.yaml>] [--db <recommendations.db>]\n"
        << "                     [--csv <out.csv>] [--verbose]\n\n"
        << "Options:\n"
        << "  --mode      Recommendation path to run\n"
        << "  --input     Event CSV (user_id or order_id, item_id)\n"
        << "  --config    YAML configuration file\n"
        << "  --db        SQLite database to write (overrides output.database_path)\n"
        << "  --csv       CSV file to write\n"
        << "  --verbose   Enable debug logging\n"
        << "  --help      Show this message\n\n"
        << "At least one of --db, --csv or output.database_path is required.\n";
}

std::optional<BatchOptions> BatchRunner::ParseArgs(const std::vector<std::string>& args,
                                                   std::string& error) {
    BatchOptions options;
    bool mode_set = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            return options;
        }
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
            continue;
        }

        if (arg != "--mode" && arg != "--input" && arg != "--config" &&
            arg != "--db" && arg != "--csv") {
            error = "Unknown argument: " + arg;
            return std::nullopt;
        }
        if (i + 1 >= args.size()) {
            error = "Missing value for " + arg;
            return std::nullopt;
        }
        const std::string& value = args[++i];

        if (arg == "--mode") {
            try {
                options.mode = ParseModelType(value);
            } catch (const std::invalid_argument&) {
                error = "Unknown mode: " + value + " (expected pairwise or itemset)";
                return std::nullopt;
            }
            mode_set = true;
        } else if (arg == "--input") {
            options.input_path = value;
        } else if (arg == "--config") {
            options.config_path = value;
        } else if (arg == "--db") {
            options.db_path = value;
        } else {
            options.csv_path = value;
        }
    }

    if (!mode_set) {
        error = "--mode is required";
        return std::nullopt;
    }
    if (options.input_path.empty()) {
        error = "--input is required";
        return std::nullopt;
    }

    return options;
}

int BatchRunner::Run(const std::vector<std::string>& args) {
    std::string error;
    auto options = ParseArgs(args, error);
    if (!options) {
        err_ << "Error: " << error << "\n\n";
        PrintUsage(err_);
        return kExitUsage;
    }
    if (options->show_help) {
        PrintUsage(out_);
        return kExitOk;
    }

    try {
        return Execute(*options);
    } catch (const std::exception& e) {
        err_ << "Fatal error: " << e.what() << "\n";
        return kExitFatal;
    }
}

int BatchRunner::Execute(const BatchOptions& options) {
    PipelineConfig config = PipelineConfig::Default();
    if (!options.config_path.empty()) {
        auto loaded = PipelineConfig::LoadFromFile(options.config_path);
        if (!loaded) {
            err_ << "Fatal error: could not load configuration from "
                 << options.config_path << "\n";
            return kExitFatal;
        }
        config = *loaded;
    }
    if (!options.db_path.empty()) {
        config.output.database_path = options.db_path;
    }
    if (options.verbose) {
        config.logging.debug_logging = true;
    }

    if (config.output.database_path.empty() && options.csv_path.empty()) {
        err_ << "Error: no output sink configured\n\n";
        PrintUsage(err_);
        return kExitUsage;
    }

    // Fail fast on configuration before touching the input
    RecommendationPipeline pipeline(config);

    EventReader::Config reader_config;
    reader_config.debug_logging = config.logging.debug_logging;
    auto events = EventReader(reader_config).ReadFile(options.input_path);

    PipelineResult result = pipeline.Run(options.mode, events);

    OutputAssembler::Config assembler_config;
    assembler_config.debug_logging = config.logging.debug_logging;
    OutputAssembler assembler(assembler_config);

    const std::string generated_at =
        generated_at_.empty() ? OutputAssembler::CurrentTimestamp() : generated_at_;
    auto records = assembler.Assemble(result.batch.recommendations, generated_at);

    if (!config.output.database_path.empty()) {
        RecommendationStore::Config store_config;
        store_config.db_path = config.output.database_path;
        store_config.table_name = config.output.table_name;
        store_config.max_write_attempts = config.output.max_write_attempts;
        store_config.debug_logging = config.logging.debug_logging;

        RecommendationStore store(store_config);
        store.ReplaceAll(records);
    }

    if (!options.csv_path.empty()) {
        std::ofstream csv(options.csv_path);
        if (!csv.is_open()) {
            throw std::runtime_error("Failed to open CSV output: " + options.csv_path);
        }
        assembler.WriteCsv(csv, records);
        if (!csv.good()) {
            throw std::runtime_error("Failed to write CSV output: " + options.csv_path);
        }
    }

    out_ << "Wrote " << records.size() << " " << ToString(options.mode)
         << " recommendations for " << result.batch.SucceededCount() << " entities\n";
    ReportFailures(result.batch);

    last_result_ = std::move(result);
    return kExitOk;
}

void BatchRunner::ReportFailures(const RecommendationBatch& batch) const {
    if (!batch.HasFailures()) {
        return;
    }

    err_ << batch.failures.size() << " of " << batch.entities_processed
         << " entities failed:\n";
    size_t listed = std::min(batch.failures.size(), kMaxListedFailures);
    for (size_t i = 0; i < listed; ++i) {
        err_ << "  " << batch.failures[i].entity_id.ToString() << ": "
             << batch.failures[i].reason << "\n";
    }
    if (batch.failures.size() > listed) {
        err_ << "  ... and " << (batch.failures.size() - listed) << " more\n";
    }
}

} // namespace itemrec
