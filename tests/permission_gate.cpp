#include "wormhole/Errors.hpp"
#include "wormhole/receive/PermissionGate.hpp"

#include <cassert>
#include <sstream>
#include <string>

using wormhole::receive::PermissionGate;

namespace {

struct Answer {
    bool granted{false};
    std::string out;
    std::string err;
};

Answer ask(const std::string& input, bool auto_accept = false) {
    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream err;
    Answer answer{};
    try {
        PermissionGate(auto_accept, in, out, err).request();
        answer.granted = true;
    } catch (const wormhole::ResponderError& ex) {
        assert(ex.response() == "transfer rejected");
    }
    answer.out = out.str();
    answer.err = err.str();
    return answer;
}

}  // namespace

int main() {
    const auto yes = ask("y\n");
    assert(yes.granted);
    assert(yes.out == "ok? (y/n): ");
    assert(yes.err.empty());

    assert(ask("  YES please\n").granted);

    const auto no = ask("n\n");
    assert(!no.granted);
    assert(no.err == "transfer rejected\n");

    const auto eof = ask("");
    assert(!eof.granted);
    assert(eof.err == "transfer rejected\n");

    const auto retry = ask("maybe\n\ny\n");
    assert(retry.granted);
    assert(retry.out.find("Unrecognized answer") != std::string::npos);

    const auto automatic = ask("", true);
    assert(automatic.granted);
    assert(automatic.out.empty());

    return 0;
}
