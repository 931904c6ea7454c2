#include "wormhole/receive/PermissionGate.hpp"

#include "wormhole/Errors.hpp"
#include "wormhole/diagnostics/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace wormhole::receive {

namespace {

std::string normalize(std::string value) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) { return !is_space(ch); }).base(), value.end());
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

}  // namespace

PermissionGate::PermissionGate(bool auto_accept, std::istream& in, std::ostream& out, std::ostream& err)
    : auto_accept_(auto_accept), in_(in), out_(out), err_(err) {}

void PermissionGate::request() {
    if (auto_accept_) {
        diagnostics::log_info("receive.consent", {{"answer", "yes"}, {"source", "auto"}});
        return;
    }

    while (true) {
        out_ << "ok? (y/n): ";
        out_.flush();

        std::string input;
        if (!std::getline(in_, input)) {
            break;
        }
        const auto answer = normalize(std::move(input));
        if (!answer.empty() && answer.front() == 'y') {
            diagnostics::log_info("receive.consent", {{"answer", "yes"}});
            return;
        }
        if (!answer.empty() && answer.front() == 'n') {
            break;
        }
        out_ << "Unrecognized answer. Type 'y' for yes or 'n' for no." << std::endl;
    }

    err_ << "transfer rejected" << std::endl;
    diagnostics::log_info("receive.rejected", {{"reason", "transfer rejected"}});
    throw ResponderError("transfer rejected");
}

}  // namespace wormhole::receive
