#include "apf_planner/io/path_exporter.hpp"
#include "apf_planner/utils/logging.hpp"
#include <fstream>
#include <stdexcept>

namespace apf_planner {

void PathExporter::writeCsv(const Path& path, std::ostream& output) {
    output << "step,row,col\n";
    for (std::size_t i = 0; i < path.points.size(); ++i) {
        output << i << "," << path.points[i].row << "," << path.points[i].col << "\n";
    }
}

void PathExporter::exportCsv(const Path& path, const std::string& filename) {
    std::ofstream file(filename, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open output file: " + filename);
    }

    writeCsv(path, file);
    file.flush();

    if (!file) {
        throw std::runtime_error("failed to write waypoints to " + filename);
    }

    APF_LOG_INFO("path_exporter", logging::format_string(
        "exported %zu waypoints to %s", path.size(), filename.c_str()));
}

} // namespace apf_planner
