#include <catch2/catch.hpp>
#include <bru/json.h>
#include <string>
#include <vector>

using namespace bru;

TEST_CASE("No blocks print as an empty JSON array", "[json][unit]") {
    REQUIRE(dump_json({}) == "[]");
    REQUIRE(dump_json({}, 0) == "[]");
}

TEST_CASE("Compact JSON keeps everything on one line", "[json][unit]") {
    std::vector<Block> blocks = {DictionaryBlock("meta", "", {{"url", "https://toto.com"}})};
    REQUIRE(dump_json(blocks, 0) ==
            R"([{"tag":"meta","name":"meta","type":"","kind":"dictionary","content":[{"key":"url","value":"https://toto.com"}]}])");
}

TEST_CASE("Indented JSON puts each field on its own line", "[json][unit]") {
    std::vector<Block> blocks = {DictionaryBlock("meta", "", {{"url", "https://toto.com"}})};
    std::string expected = R"([
  {
    "tag": "meta",
    "name": "meta",
    "type": "",
    "kind": "dictionary",
    "content": [
      {"key": "url", "value": "https://toto.com"}
    ]
  }
])";
    REQUIRE(dump_json(blocks) == expected);
}

TEST_CASE("Array and text content print as list and string", "[json][unit]") {
    std::vector<Block> blocks = {
        ArrayBlock("vars", "secret", {"a", "~b"}),
        TextBlock("tests", "", "  x(\"y\");\n\tz\\"),
    };
    std::string out = dump_json(blocks, 0);
    REQUIRE(out ==
            R"([{"tag":"vars:secret","name":"vars","type":"secret","kind":"array","content":["a","~b"]},)"
            R"({"tag":"tests","name":"tests","type":"","kind":"text","content":"  x(\"y\");\n\tz\\"}])");
}

TEST_CASE("Empty content prints as empty list or string", "[json][unit]") {
    std::vector<Block> blocks = {DictionaryBlock("headers"), ArrayBlock("vars", "secret"), TextBlock("body")};
    std::string out = dump_json(blocks, 0);
    REQUIRE(out.find(R"("kind":"dictionary","content":[])") != std::string::npos);
    REQUIRE(out.find(R"("kind":"array","content":[])") != std::string::npos);
    REQUIRE(out.find(R"("kind":"text","content":"")") != std::string::npos);
}

TEST_CASE("Control characters are escaped as unicode", "[json][unit]") {
    std::vector<Block> blocks = {TextBlock("body", "text", std::string("a\x01") + "b")};
    REQUIRE(dump_json(blocks, 0).find(R"("content":"a\u0001b")") != std::string::npos);
}
