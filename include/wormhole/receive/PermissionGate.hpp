#pragma once

#include <iosfwd>

namespace wormhole::receive {

// Asks the local user whether an offered transfer may proceed.
class PermissionGate {
public:
    PermissionGate(bool auto_accept, std::istream& in, std::ostream& out, std::ostream& err);

    // Returns once consent is granted. A "no" answer or end of input prints
    // "transfer rejected" and throws ResponderError("transfer rejected").
    void request();

private:
    bool auto_accept_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};

}  // namespace wormhole::receive
