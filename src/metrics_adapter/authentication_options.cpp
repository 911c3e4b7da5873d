#include "metrics_adapter/authentication_options.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <fmt/format.h>

#include "metrics_adapter/certificate.hpp"
#include "metrics_adapter/delegated_kubeconfig.hpp"
#include "metrics_adapter/logging.hpp"

namespace metrics_adapter {

namespace po = boost::program_options;

namespace {

constexpr char k_standard_username_header[] = "X-Remote-User";

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char character) { return std::isspace(character) != 0; });
}

void check_for_whitespace_only(ValidationErrorList& errors, const char* flag, const std::vector<std::string>& values) {
    for (const std::string& value : values) {
        if (is_blank(value)) {
            errors.push_back({flag, "empty value in list"});
            return;
        }
    }
}

bool contains_case_insensitive(const std::vector<std::string>& values, const std::string& needle) {
    const auto equals_ignoring_case = [&needle](const std::string& candidate) {
        return candidate.size() == needle.size()
            && std::equal(candidate.begin(), candidate.end(), needle.begin(), [](char lhs, char rhs) {
                   return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
               });
    };
    return std::any_of(values.begin(), values.end(), equals_ignoring_case);
}

}  // namespace

ValidationErrorList AuthenticationOptions::validate() const {
    ValidationErrorList errors;

    check_for_whitespace_only(errors, "requestheader-username-headers", request_header.username_headers);
    check_for_whitespace_only(errors, "requestheader-uid-headers", request_header.uid_headers);
    check_for_whitespace_only(errors, "requestheader-group-headers", request_header.group_headers);
    check_for_whitespace_only(errors, "requestheader-extra-headers-prefix", request_header.extra_header_prefixes);
    check_for_whitespace_only(errors, "requestheader-allowed-names", request_header.allowed_names);

    if (!request_header.username_headers.empty()
        && !contains_case_insensitive(request_header.username_headers, k_standard_username_header)) {
        get_logger()->warn("--requestheader-username-headers is set without specifying the standard {} header; "
                           "API aggregation will not work", k_standard_username_header);
    }

    if (webhook_retry_steps <= 0) {
        errors.push_back({"", "number of webhook retry attempts must be greater than 0"});
    }
    if (cache_ttl.count() < 0) {
        errors.push_back({"authentication-token-webhook-cache-ttl", "must not be negative"});
    }

    return errors;
}

void AuthenticationOptions::add_flags(po::options_description& flag_set) {
    flag_set.add_options()
        ("authentication-kubeconfig", po::value<std::string>(&remote_kubeconfig_file)->default_value(remote_kubeconfig_file),
         "kubeconfig file pointing at the 'core' kubernetes server with enough rights to create tokenreviews.")
        ("authentication-kubeconfig-optional", switch_value(remote_kubeconfig_file_optional),
         "If true, a missing authentication kubeconfig disables token review instead of failing startup.")
        ("authentication-token-webhook-cache-ttl", duration_value(cache_ttl),
         "The duration to cache responses from the webhook token authenticator.")
        ("authentication-skip-lookup", switch_value(skip_in_cluster_lookup),
         "If false, the authentication-kubeconfig will be used to lookup missing authentication configuration from the cluster.")
        ("authentication-tolerate-lookup-failure", switch_value(tolerate_in_cluster_lookup_failure),
         "If true, failures to look up missing authentication configuration from the cluster are not considered fatal.")
        ("anonymous-auth", switch_value(anonymous),
         "Enables anonymous requests to the secure port. Anonymous requests have a username of system:anonymous.")
        ("client-ca-file", po::value<std::string>(&client_ca_file)->default_value(client_ca_file),
         "If set, any request presenting a client certificate signed by one of the authorities in the client-ca-file "
         "is authenticated with an identity corresponding to the CommonName of the client certificate.")
        ("requestheader-client-ca-file",
         po::value<std::string>(&request_header.client_ca_file)->default_value(request_header.client_ca_file),
         "Root certificate bundle to use to verify client certificates on incoming requests before trusting usernames "
         "in headers specified by --requestheader-username-headers.")
        ("requestheader-username-headers", list_value(request_header.username_headers),
         "List of request headers to inspect for usernames. X-Remote-User is common.")
        ("requestheader-uid-headers", list_value(request_header.uid_headers),
         "List of request headers to inspect for UIDs. X-Remote-Uid is suggested.")
        ("requestheader-group-headers", list_value(request_header.group_headers),
         "List of request headers to inspect for groups. X-Remote-Group is suggested.")
        ("requestheader-extra-headers-prefix", list_value(request_header.extra_header_prefixes),
         "List of request header prefixes to inspect. X-Remote-Extra- is suggested.")
        ("requestheader-allowed-names", list_value(request_header.allowed_names),
         "List of client certificate common names to allow to provide usernames in headers. If empty, any client "
         "certificate validated by the authorities in --requestheader-client-ca-file is allowed.");
}

void AuthenticationOptions::apply_to(AuthenticationInfo& authentication,
                                     SecureServingInfo* serving,
                                     const AudienceGetter& audiences) const {
    auto logger = get_logger();

    AuthenticationInfo info{};
    info.anonymous_allowed = anonymous;
    if (audiences) {
        info.api_audiences = audiences();
    }

    if (!client_ca_file.empty()) {
        info.client_ca = load_certificate_bundle(client_ca_file);
        logger->info("Loaded {} client CA certificate(s) from {}", info.client_ca->subjects.size(), client_ca_file);
    }

    const std::optional<DelegateSource> delegate_source =
        resolve_delegated_kubeconfig(remote_kubeconfig_file, remote_kubeconfig_file_optional, "authentication");

    if (!request_header.client_ca_file.empty()) {
        RequestHeaderConfig header_config{};
        header_config.username_headers = request_header.username_headers;
        header_config.uid_headers = request_header.uid_headers;
        header_config.group_headers = request_header.group_headers;
        header_config.extra_header_prefixes = request_header.extra_header_prefixes;
        header_config.allowed_names = request_header.allowed_names;
        header_config.client_ca = load_certificate_bundle(request_header.client_ca_file);
        info.request_header = std::move(header_config);
    } else if (!skip_in_cluster_lookup && delegate_source.has_value()) {
        RequestHeaderConfig header_config{};
        header_config.discover_from_cluster = true;
        header_config.tolerate_lookup_failure = tolerate_in_cluster_lookup_failure;
        info.request_header = std::move(header_config);
    } else if (!skip_in_cluster_lookup) {
        logger->warn("No authentication-kubeconfig provided in order to lookup requestheader-client-ca-file "
                     "from the cluster; request-header authentication is disabled");
    }

    if (delegate_source.has_value()) {
        TokenReviewConfig token_review{};
        token_review.source = *delegate_source;
        token_review.cache_ttl = cache_ttl;
        token_review.request_timeout = token_request_timeout;
        token_review.retry_steps = webhook_retry_steps;
        info.token_review = std::move(token_review);
    } else {
        logger->warn("No authentication-kubeconfig provided; TokenReview of bearer tokens won't work");
    }

    if (serving != nullptr && info.client_ca.has_value()) {
        serving->add_client_ca(*info.client_ca);
    }
    if (serving != nullptr && info.request_header.has_value() && info.request_header->client_ca.has_value()) {
        serving->add_client_ca(*info.request_header->client_ca);
    }

    info.configured = true;
    authentication = std::move(info);
}

}  // namespace metrics_adapter
