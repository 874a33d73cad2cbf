#include "scicalc/expression_processor.hpp"

namespace scicalc {

BatchSummary evaluateFile(const Calculator& calculator, const std::filesystem::path& inputPath,
                          const std::filesystem::path& outputPath, std::size_t threadCount,
                          std::atomic<std::size_t>& completed) {
    CsvWriter writer(outputPath);
    ThreadPool pool(threadCount);
    BatchSummary summary;

    // Пачки приходят в порядке строк, поэтому пишутся сразу
    processExpressionsStreaming(inputPath, calculator, pool, completed,
                                [&](const std::vector<EvaluationRecord>& batch) {
                                    for (const auto& record : batch) {
                                        ++summary.total;
                                        if (record.status == "success") {
                                            ++summary.succeeded;
                                        } else {
                                            ++summary.failed;
                                        }
                                    }
                                    writer.write(batch);
                                });
    return summary;
}

} // namespace scicalc
