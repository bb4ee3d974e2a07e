#ifndef APF_PLANNER_IO_PATH_EXPORTER_HPP_
#define APF_PLANNER_IO_PATH_EXPORTER_HPP_

#include "apf_planner/core/types.hpp"
#include <ostream>
#include <string>

namespace apf_planner {

/**
 * @brief 経由点のCSV出力（ヘッダ: step,row,col）
 */
class PathExporter {
public:
    static void writeCsv(const Path& path, std::ostream& output);

    /**
     * @throws std::runtime_error ファイルを開けない、または書き込みに失敗した場合
     */
    static void exportCsv(const Path& path, const std::string& filename);
};

} // namespace apf_planner

#endif // APF_PLANNER_IO_PATH_EXPORTER_HPP_
