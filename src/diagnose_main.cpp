#include "bridge_config.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "relay_client.hpp"

#include <log4cplus/initializer.h>

#include <iostream>
#include <string>
#include <vector>

namespace {

struct Check {
    std::string name;
    modelbridge::CommandResult result;
};

void print_check(const Check& check) {
    std::cout << (check.result.success ? "[ OK ] " : "[FAIL] ") << check.name << std::endl;
    if (check.result.success) {
        if (!check.result.result.is_null()) {
            std::cout << "       " << modelbridge::codec::to_text(check.result.result) << std::endl;
        }
    } else {
        std::cout << "       Error: " << check.result.error.value_or("Unknown error") << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    modelbridge::DiagnoseConfig config;
    try {
        config = modelbridge::parse_diagnose_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0] << " [--host H] [--port N] [--config PATH]" << std::endl;
        return 2;
    }

    if (config.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        return 0;
    }

    init_logging(config.config_path);

    modelbridge::net::RelayClient relay(config.relay);

    std::cout << "=== modelbridge connection diagnostic ===" << std::endl;
    std::cout << "Command server: " << config.relay.host << ":" << config.relay.port << std::endl << std::endl;

    std::vector<Check> checks;
    checks.push_back({"health_check", relay.invoke("health_check", modelbridge::json::object())});

    if (!checks.back().result.success) {
        print_check(checks.back());
        std::cout << std::endl << "Cannot continue without a connection to the command server." << std::endl;
        return 1;
    }

    checks.push_back({"get_scene_info", relay.invoke("scene_tools.get_scene_info", modelbridge::json::object())});
    checks.push_back({"create_box",
                      relay.invoke("geometry_tools.create_box",
                                   {{"cornerX", 0}, {"cornerY", 0}, {"cornerZ", 0},
                                    {"width", 10}, {"depth", 10}, {"height", 10},
                                    {"color", "red"}})});

    bool all_ok = true;
    for (const auto& check : checks) {
        print_check(check);
        all_ok = all_ok && check.result.success;
    }

    std::cout << std::endl;
    if (all_ok) {
        std::cout << "All checks passed." << std::endl;
        return 0;
    }

    const auto& health = checks.front().result.result;
    if (health.is_object() && !modelbridge::codec::as_bool(health.value("activeDocument", modelbridge::json()), true)) {
        std::cout << "The host reports no active document. Open a document and retry." << std::endl;
    }
    return 1;
}
