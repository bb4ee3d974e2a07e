#include <iostream>
#include <stdexcept>
#include <string>

#include "apf_planner/core/path_planner.hpp"
#include "apf_planner/io/grid_loader.hpp"
#include "apf_planner/io/path_exporter.hpp"
#include "apf_planner/utils/logging.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitPartial = 1;
constexpr int kExitError = 2;

void print_usage(const char* program)
{
    std::cerr << "Usage: " << program << " <map-file> [options]\n"
              << "Options:\n"
              << "  --robot-width <cells>       robot footprint width (default 2)\n"
              << "  --robot-height <cells>      robot footprint height (default 2)\n"
              << "  --attractive-gain <value>   goal attraction gain (default 1.0)\n"
              << "  --repulsive-gain <value>    obstacle repulsion gain (default 50.0)\n"
              << "  --influence <cells>         obstacle influence radius (default 3.0)\n"
              << "  --export <file.csv>         write waypoints as CSV\n"
              << "  --log-file <file>           also write log to file\n"
              << "  --verbose                   enable debug logging\n";
}

struct Options {
    std::string map_file;
    std::string export_file;
    std::string log_file;
    bool verbose = false;
    apf_planner::PlannerConfig config;
};

// 不正な引数は std::invalid_argument を送出
Options parse_arguments(int argc, char** argv)
{
    Options options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--robot-width") {
            options.config.robot_width = std::stoi(next_value());
        } else if (arg == "--robot-height") {
            options.config.robot_height = std::stoi(next_value());
        } else if (arg == "--attractive-gain") {
            options.config.field.attractive_gain = std::stod(next_value());
        } else if (arg == "--repulsive-gain") {
            options.config.field.repulsive_gain = std::stod(next_value());
        } else if (arg == "--influence") {
            options.config.field.influence_radius = std::stod(next_value());
        } else if (arg == "--export") {
            options.export_file = next_value();
        } else if (arg == "--log-file") {
            options.log_file = next_value();
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else if (options.map_file.empty()) {
            options.map_file = arg;
        } else {
            throw std::invalid_argument("unexpected argument " + arg);
        }
    }

    if (options.map_file.empty()) {
        throw std::invalid_argument("map file is required");
    }

    return options;
}

} // namespace

int main(int argc, char** argv)
{
    Options options;
    try {
        options = parse_arguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return kExitError;
    }

    auto& logger = apf_planner::logging::Logger::instance();
    if (options.verbose) {
        logger.set_level(apf_planner::logging::LogLevel::DEBUG);
    }
    if (!options.log_file.empty() && !logger.add_file_sink(options.log_file)) {
        std::cerr << "Warning: cannot open log file " << options.log_file << std::endl;
    }

    try {
        // マップ読み込み
        const auto grid = apf_planner::GridLoader::loadFromFile(options.map_file);

        // 経路計画
        apf_planner::PathPlanner planner(options.config);
        const auto result = planner.plan(grid);

        std::cout << result.statistics.summary();

        // 経由点の出力
        if (!options.export_file.empty()) {
            apf_planner::PathExporter::exportCsv(result.path_result.path, options.export_file);
        }

        logger.flush();
        return result.success() ? kExitSuccess : kExitPartial;

    } catch (const std::exception& e) {
        APF_LOG_ERROR("main", e.what());
        logger.flush();
        return kExitError;
    }
}
