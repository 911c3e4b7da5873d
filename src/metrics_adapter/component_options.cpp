#include "metrics_adapter/component_options.hpp"

#include <stdexcept>

#include <boost/program_options/errors.hpp>

namespace metrics_adapter {

namespace po = boost::program_options;

std::string ValidationError::to_string() const {
    if (flag.empty()) {
        return message;
    }
    return "--" + flag + ": " + message;
}

po::typed_value<std::string>* duration_value(Duration& target) {
    return po::value<std::string>()
        ->default_value(format_duration(target))
        ->notifier([&target](const std::string& raw) {
            try {
                target = parse_duration(raw);
            } catch (const std::exception&) {
                throw po::invalid_option_value(raw);
            }
        });
}

po::typed_value<std::string>* list_value(std::vector<std::string>& target) {
    return po::value<std::string>()
        ->default_value(join_list(target))
        ->notifier([&target](const std::string& raw) { target = split_list(raw); });
}

po::typed_value<bool>* switch_value(bool& target) {
    return po::value<bool>(&target)->default_value(target)->implicit_value(true);
}

}  // namespace metrics_adapter
