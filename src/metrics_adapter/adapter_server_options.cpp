#include "metrics_adapter/adapter_server_options.hpp"

#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "metrics_adapter/logging.hpp"
#include "metrics_adapter/shared_informer_factory.hpp"

namespace metrics_adapter {

namespace po = boost::program_options;

namespace {

constexpr char k_self_signed_host[] = "localhost";
constexpr char k_self_signed_ip[] = "127.0.0.1";

/** @brief One stage of option application. */
struct ApplyStep final {
    ApplyStage stage;
    std::string_view description;
    std::function<void()> run;
};

void append_errors(ValidationErrorList& errors, const ComponentOptions& component) {
    ValidationErrorList component_errors = component.validate();
    errors.insert(errors.end(), component_errors.begin(), component_errors.end());
}

}  // namespace

AdapterServerOptions AdapterServerOptions::create() {
    AdapterServerOptions options{};
    options.secure_serving = std::make_shared<SecureServingOptions>();
    options.authentication = std::make_shared<AuthenticationOptions>();
    options.authorization = std::make_shared<AuthorizationOptions>();
    options.audit = std::make_shared<AuditOptions>();
    options.features = std::make_shared<FeatureOptions>();
    return options;
}

ValidationErrorList AdapterServerOptions::validate() const {
    ValidationErrorList errors;
    append_errors(errors, *secure_serving);
    append_errors(errors, *authentication);
    append_errors(errors, *authorization);
    append_errors(errors, *audit);
    append_errors(errors, *features);
    return errors;
}

void AdapterServerOptions::add_flags(po::options_description& flag_set) {
    secure_serving->add_flags(flag_set);
    authentication->add_flags(flag_set);
    authorization->add_flags(flag_set);
    audit->add_flags(flag_set);
    features->add_flags(flag_set);
}

void AdapterServerOptions::apply_to(ServerConfig& server_config, const RestConfig& client_config) {
    const DefaultClientFactory client_factory{};
    apply_to(server_config, client_config, client_factory);
}

void AdapterServerOptions::apply_to(ServerConfig& server_config,
                                    const RestConfig& client_config,
                                    const ClientFactory& client_factory) {
    auto logger = get_logger();
    logger->info("Applying server options with external client {}", client_config.redacted());

    ApiClientPtr client;
    SharedInformerFactoryPtr informers;

    // Order is a contract: authentication reads the serving result, and the
    // client is built only once every local step has succeeded.
    const std::vector<ApplyStep> steps{
        {ApplyStage::CertificateGeneration, "error creating self-signed certificates",
         [this]() { secure_serving->maybe_default_with_self_signed_certs(k_self_signed_host, {}, {k_self_signed_ip}); }},
        {ApplyStage::SecureServing, "error applying secure serving options",
         [this, &server_config]() {
             secure_serving->apply_to(server_config.secure_serving, server_config.loopback_client_config);
         }},
        {ApplyStage::Authentication, "error applying authentication options",
         [this, &server_config]() {
             SecureServingInfo* serving = server_config.secure_serving.has_value() ? &*server_config.secure_serving : nullptr;
             authentication->apply_to(server_config.authentication, serving, nullptr);
         }},
        {ApplyStage::Authorization, "error applying authorization options",
         [this, &server_config]() { authorization->apply_to(server_config.authorization); }},
        {ApplyStage::Audit, "error applying audit options",
         [this, &server_config]() { audit->apply_to(server_config); }},
        {ApplyStage::ClientConstruction, "failed to create real external clientset",
         [&client, &informers, &client_config, &client_factory]() {
             client = client_factory.new_for_config(client_config);
             informers = client_factory.new_informer_factory(client, k_informer_resync);
         }},
        {ApplyStage::Features, "error applying feature options",
         [this, &server_config, &client, &informers]() { features->apply_to(server_config, client, informers); }},
    };

    for (const ApplyStep& step : steps) {
        logger->debug("Applying {} options", to_string(step.stage));
        try {
            step.run();
        } catch (const ApplyError& exc) {
            logger->error("Stage {} failed: {}", to_string(exc.stage()), exc.what());
            throw;
        } catch (const std::exception& exc) {
            logger->error("Stage {} failed: {}", to_string(step.stage), exc.what());
            throw ApplyError(step.stage, std::string{step.description} + ": " + exc.what());
        }
    }

    if (openapi_config) {
        server_config.openapi_config = openapi_config;
    }
    if (openapi_v3_config) {
        server_config.openapi_v3_config = openapi_v3_config;
    }

    server_config.enable_metrics = enable_metrics;
    logger->info("Server options applied");
}

}  // namespace metrics_adapter
