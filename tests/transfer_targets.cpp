#include "wormhole/Errors.hpp"
#include "wormhole/receive/TransferTargets.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace wormhole;

int main() {
    test::ScopedTempDir dir;
    const auto destination = dir.path() / "payload.bin";

    {
        receive::FileTarget target(destination);
        assert(std::filesystem::exists(dir.path() / "payload.bin.tmp"));
        target.write(to_bytes("hello "));
        target.write(to_bytes("world"));
        assert(target.bytes_written() == 11);
        assert(!std::filesystem::exists(destination));
        target.commit();
    }
    assert(test::read_file(destination) == "hello world");
    assert(!std::filesystem::exists(dir.path() / "payload.bin.tmp"));

    const auto abandoned = dir.path() / "abandoned.bin";
    {
        receive::FileTarget target(abandoned);
        target.write(to_bytes("partial"));
    }
    assert(!std::filesystem::exists(abandoned));
    assert(!std::filesystem::exists(dir.path() / "abandoned.bin.tmp"));

    // A file already holding the "<name>.tmp" name is left alone.
    const auto claimed = dir.path() / "claimed.bin";
    test::write_file(dir.path() / "claimed.bin.tmp", "keep me");
    std::filesystem::path side_path;
    {
        receive::FileTarget target(claimed);
        side_path = target.temp_path();
        assert(side_path != dir.path() / "claimed.bin.tmp");
        assert(side_path.filename().string().rfind("claimed.bin.tmp-", 0) == 0);
        target.write(to_bytes("fresh"));
        target.commit();
    }
    assert(test::read_file(claimed) == "fresh");
    assert(test::read_file(dir.path() / "claimed.bin.tmp") == "keep me");
    assert(!std::filesystem::exists(side_path));

    test::write_file(dir.path() / "held.bin.tmp", "keep me too");
    {
        receive::FileTarget target(dir.path() / "held.bin");
        target.write(to_bytes("dropped"));
    }
    assert(test::read_file(dir.path() / "held.bin.tmp") == "keep me too");
    assert(!std::filesystem::exists(dir.path() / "held.bin"));

    // Something that shows up at the destination mid-transfer is never replaced.
    const auto contested = dir.path() / "contested.bin";
    std::filesystem::path contested_temp;
    {
        receive::FileTarget target(contested);
        contested_temp = target.temp_path();
        target.write(to_bytes("ours"));
        test::write_file(contested, "theirs");
        bool refused = false;
        try {
            target.commit();
        } catch (const TransferError& ex) {
            std::cerr << "[TransferTargets] expected failure: " << ex.what() << std::endl;
            refused = true;
        }
        assert(refused);
    }
    assert(test::read_file(contested) == "theirs");
    assert(!std::filesystem::exists(contested_temp));

    receive::SpoolTarget small(16);
    small.write(to_bytes("0123456789"));
    assert(!small.spilled());
    small.write(to_bytes("abcdefghij"));
    assert(small.spilled());
    assert(small.size() == 20);

    std::string window(6, '\0');
    small.read_at(7, reinterpret_cast<std::uint8_t*>(window.data()), window.size());
    assert(window == "789abc");
    small.write(to_bytes("XYZ"));
    small.read_at(18, reinterpret_cast<std::uint8_t*>(window.data()), 5);
    assert(window.substr(0, 5) == "ijXYZ");

    bool threw = false;
    try {
        small.read_at(20, reinterpret_cast<std::uint8_t*>(window.data()), 4);
    } catch (const TransferError&) {
        threw = true;
    }
    assert(threw);

    receive::SpoolTarget memory;
    memory.write(to_bytes("in memory"));
    assert(!memory.spilled());
    std::string copy(9, '\0');
    memory.read_at(0, reinterpret_cast<std::uint8_t*>(copy.data()), copy.size());
    assert(copy == "in memory");

    return 0;
}
