// File: main.cpp

#include <iostream>
#include <memory>
#include <string>

#include "api/comparison_service.hpp"
#include "common/io/io.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "storage/in_memory_result_store.hpp"

namespace {
    void printUsage(const char *program) {
        std::cerr << "Usage: " << program << " <before-image> <after-image> [output.png] [configuration.yaml]\n";
    }

    int run(const int argc, char *argv[]) {
        const std::string before_path = argv[1];
        const std::string after_path = argv[2];
        const std::string output_path = argc > 3 ? argv[3] : "diff.png";

        config::initialize(argc > 4 ? argv[4] : "");
        common::logging::Logger::setLogLevel(config::get("logging.level", "info"));

        const auto store = std::make_shared<storage::InMemoryResultStore>();
        const api::ComparisonService service(
                store, processing::image::VisualiserOptions::fromConfiguration(config::Configuration::getInstance()));

        api::CompareRequest request;
        request.before_image = common::io::readBytes(before_path);
        request.after_image = common::io::readBytes(after_path);
        request.comparison_type = config::get("comparison.type", "pixel");
        request.visualisation_type = config::get("visualisation.type", "heatmap");
        request.sensitivity = config::get("comparison.sensitivity", 50);

        const auto id = service.compare(request);
        const auto stored = store->read(id);
        common::io::writeBytes(output_path, stored->visualisation().value());

        Json::Value summary(Json::objectValue);
        summary["id"] = id;
        summary["score"] = stored->score();
        summary["comparison_type"] = request.comparison_type;
        summary["visualisation_type"] = request.visualisation_type;
        summary["output"] = output_path;
        std::cout << summary.toStyledString();

        LOG_INFO("Difference score {:.2f}, overlay written to {}", stored->score(), output_path);
        return 0;
    }
} // namespace

int main(const int argc, char *argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    common::logging::Logger::initialize("./logs", "imgdiff.log", "info");

    try {
        return run(argc, argv);
    } catch (const api::ApiError &e) {
        LOG_ERROR("Comparison rejected ({}): {}", e.status(), e.what());
        std::cout << e.toJson().toStyledString();
    } catch (const std::exception &e) {
        LOG_CRITICAL("imgdiff failed: {}", e.what());
    }
    return 1;
}
