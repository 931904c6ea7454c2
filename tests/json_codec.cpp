#include "wormhole/protocol/Json.hpp"

#include <cassert>
#include <string>

namespace json = wormhole::protocol::json;

int main() {
    const auto value = json::parse(R"({"offer": {"file": {"filename": "aé.txt", "filesize": 12}},
                                       "list": [1, 2.5, true, null, "x\n"]})");
    assert(value.is_object());
    const auto* offer = value.find("offer");
    assert(offer != nullptr && offer->is_object());
    const auto* file = offer->find("file");
    assert(file != nullptr);
    assert(file->find("filename")->string_value == "a\xc3\xa9.txt");
    assert(file->find("filesize")->is_integer());
    assert(file->find("filesize")->integer_value == 12);

    const auto& list = value.find("list")->as_array();
    assert(list.size() == 5);
    assert(list[1].is_double() && list[1].double_value == 2.5);
    assert(list[2].is_boolean() && list[2].boolean_value);
    assert(list[3].is_null());
    assert(list[4].string_value == "x\n");

    // Surrogate pairs decode to a single four-byte UTF-8 sequence.
    const auto emoji = json::parse(R"("\ud83d\ude00")");
    assert(emoji.string_value == "\xf0\x9f\x98\x80");

    assert(value.find("missing") == nullptr);
    assert(list[0].find("anything") == nullptr);
    assert(list[0].as_array().empty());

    auto message = json::Value::make_object();
    message.set("error", json::Value(std::string("quote \" and \\ backslash")));
    const auto text = json::serialize(message);
    assert(text == R"({"error":"quote \" and \\ backslash"})");
    assert(json::parse(text).find("error")->string_value == "quote \" and \\ backslash");

    bool threw = false;
    try {
        json::parse("{\"open\": ");
    } catch (const json::JsonError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        json::parse("{} trailing");
    } catch (const json::JsonError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        json::parse(std::string(200, '[') + std::string(200, ']'));
    } catch (const json::JsonError&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
