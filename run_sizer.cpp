#include "core/config_loader.hpp"
#include "engine/sizing_engine.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <stdexcept>

using namespace vram_sizer;

int main(int argc, char* argv[]) {
    std::string config_file = "sizer.ini";

    if (argc > 1) {
        config_file = argv[1];
    }

    std::cout << "========================================\n";
    std::cout << "vram_sizer: LLM Serving VRAM Planner\n";
    std::cout << "========================================\n";
    std::cout << "Loading request from: " << config_file << std::endl;

    try {
        SizingRequest request = load_sizing_request(config_file);
        request.validate();
        Logger::get().set_level(log_level_from_int(request.settings.log_level));
        print_request_summary(std::cout, request);

        ConfigurationCache cache;
        SizingEngine engine(request.settings, &cache);
        const SizingReport report = engine.evaluate(request.inventory, request.models);

        std::cout << "\n";
        print_sizing_report(std::cout, report);

        if (report.breakdown.status == BreakdownStatus::DEGRADED) {
            Logger::get().warn("breakdown is a fallback estimate: %s", report.breakdown.message.c_str());
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid request: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
