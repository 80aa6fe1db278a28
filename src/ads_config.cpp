#include "ads_config.hpp"

#include <sstream>

namespace ads {

std::vector<std::string> ClientConfig::validation_errors() const {
    std::vector<std::string> errors;

    if (host.empty()) {
        errors.push_back("Host address is empty");
    }

    if (port == 0) {
        errors.push_back("Port must be non-zero");
    }

    if (timeouts.connect.count() < 0 || timeouts.read.count() < 0 || timeouts.write.count() < 0) {
        errors.push_back("Timeouts must not be negative");
    }

    if (!source.is_auto()) {
        if (source.addr().netid.is_zero()) {
            errors.push_back("Explicit source NetId must not be 0.0.0.0.0.0");
        }
        if (source.addr().port == 0) {
            errors.push_back("Explicit source port must be non-zero");
        }
    }

    if (reconnect_delay.count() <= 0) {
        errors.push_back("Reconnect delay must be positive");
    }
    if (max_reconnect_delay < reconnect_delay) {
        std::ostringstream oss;
        oss << "Maximum reconnect delay (" << max_reconnect_delay.count()
            << " ms) is below the reconnect delay (" << reconnect_delay.count() << " ms)";
        errors.push_back(oss.str());
    }

    if (poll_interval.count() <= 0) {
        errors.push_back("Poll interval must be positive");
    }

    if (notification_queue_capacity == 0) {
        errors.push_back("Notification queue capacity must be non-zero");
    }

    return errors;
}

bool ClientConfig::is_valid(std::string* error_message) const {
    auto errors = validation_errors();
    if (errors.empty()) {
        return true;
    }

    if (error_message) {
        std::ostringstream oss;
        for (std::size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) {
                oss << "; ";
            }
            oss << errors[i];
        }
        *error_message = oss.str();
    }

    return false;
}

Status ClientConfig::validate() const {
    std::string error_message;
    if (!is_valid(&error_message)) {
        return make_error(ErrorKind::InvalidArgument, "ClientConfig validation failed: " + error_message);
    }
    return Status();
}

} // namespace ads
