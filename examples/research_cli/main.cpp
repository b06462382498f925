// examples/research_cli/main.cpp
#include <iostream>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include "core/engine.h"
#include "modules/trace/trace_exporter.h"

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <research.yaml>] [--session <id>] [--trace <file>] <query...>\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/research.yaml";
    std::string trace_path;
    researchflow::ResearchRequest request;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--session" || arg == "--trace") && i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            usage(argv[0]);
            return 1;
        }
        if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--session") {
            request.session_id = argv[++i];
        } else if (arg == "--trace") {
            trace_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else {
            if (!request.query.empty()) request.query += " ";
            request.query += arg;
        }
    }
    if (request.query.empty()) {
        usage(argv[0]);
        return 1;
    }

    try {
        // 1. 创建引擎
        auto engine = researchflow::ResearchEngine::from_config(config_path);

        // 2. 执行
        auto result = engine->run(request);

        // 3. 输出结果
        if (result.success) {
            std::cout << result.response.report << "\n\n";
        } else {
            std::cerr << "[ERROR] " << result.message << "\n";
        }

        nlohmann::json summary = result.response.to_json();
        summary.erase("report");
        summary["success"] = result.success;
        summary["message"] = result.message;
        std::cout << summary.dump(2) << std::endl;

        // 4. 导出 Trace 到文件
        if (!trace_path.empty()) {
            auto traces = engine->last_traces();
            std::ofstream trace_file(trace_path);
            if (!trace_file) {
                std::cerr << "Cannot write trace file: " << trace_path << "\n";
                return 1;
            }
            trace_file << researchflow::TraceExporter::to_json(traces).dump(2) << std::endl;
            std::cerr << "Trace exported to " << trace_path << " (" << traces.size() << " records)\n";
        }

        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
