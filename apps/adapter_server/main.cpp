#include <cstdlib>
#include <iostream>

#include <boost/program_options.hpp>

#include "metrics_adapter/adapter_server_options.hpp"
#include "metrics_adapter/configuration.hpp"
#include "metrics_adapter/logging.hpp"
#include "metrics_adapter/version.hpp"

namespace po = boost::program_options;

namespace {

void log_summary(const metrics_adapter::ServerConfig& server_config) {
    auto logger = metrics_adapter::get_logger();
    if (server_config.secure_serving.has_value()) {
        logger->info("Secure serving: {} ({} client CA bundle(s), {} SNI certificate(s))",
                     server_config.secure_serving->listen_address(),
                     server_config.secure_serving->client_ca.size(),
                     server_config.secure_serving->sni_certs.size());
    } else {
        logger->info("Secure serving: disabled");
    }
    logger->info("Authentication: anonymous={} request_header={} token_review={}",
                 server_config.authentication.anonymous_allowed,
                 server_config.authentication.request_header.has_value(),
                 server_config.authentication.token_review.has_value());
    logger->info("Authorization: subject_access_review={}",
                 server_config.authorization.subject_access_review.has_value());
    logger->info("Audit: policy={} backend={}",
                 server_config.audit_policy != nullptr,
                 server_config.audit_backend != nullptr ? server_config.audit_backend->name() : "none");
    logger->info("Features: profiling={} priority_and_fairness={} metrics={}",
                 server_config.enable_profiling,
                 server_config.flow_control != nullptr,
                 server_config.enable_metrics);
}

}  // namespace

int main(int argc, char** argv) {
    using namespace metrics_adapter;

    try {
        Configuration configuration = ConfigurationLoader::load();
        auto logger = get_logger();
        logger->info("metrics-adapter {}", k_version);

        AdapterServerOptions options = AdapterServerOptions::create();
        po::options_description flag_set{"metrics-adapter options"};
        flag_set.add_options()("help,h", "Print this help and exit.");
        options.add_flags(flag_set);

        po::variables_map flag_values;
        try {
            po::store(po::parse_command_line(argc, argv, flag_set), flag_values);
            if (flag_values.count("help") > 0) {
                std::cout << flag_set << '\n';
                return EXIT_SUCCESS;
            }
            po::notify(flag_values);
        } catch (const po::error& exc) {
            std::cerr << "Error: " << exc.what() << '\n' << flag_set << '\n';
            return EXIT_FAILURE;
        }

        const ValidationErrorList errors = options.validate();
        if (!errors.empty()) {
            for (const ValidationError& error : errors) {
                std::cerr << "Error: " << error.to_string() << '\n';
            }
            return EXIT_FAILURE;
        }

        ServerConfig server_config{};
        try {
            options.apply_to(server_config, configuration.client_config);
        } catch (const ApplyError& exc) {
            logger->critical("Unable to apply server options ({}): {}", to_string(exc.stage()), exc.what());
            return EXIT_FAILURE;
        }

        log_summary(server_config);
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
