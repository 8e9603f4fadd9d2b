// SPDX-License-Identifier: Apache-2.0
#include <mcp/FrameCodec.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace webchat;

TEST_CASE("FrameCodec decodes one message per line", "[codec]")
{
    auto codec = FrameCodec {};
    auto const frames = codec.feed("{\"a\":1}\n{\"b\":2}\n");

    REQUIRE(frames.size() == 2);
    CHECK(frames[0]["a"] == 1);
    CHECK(frames[1]["b"] == 2);
    CHECK(codec.bufferedSize() == 0);
}

TEST_CASE("FrameCodec holds back a partial line until its newline arrives", "[codec]")
{
    auto codec = FrameCodec {};

    CHECK(codec.feed("{\"id\":1,\"res").empty());
    CHECK(codec.bufferedSize() > 0);

    auto const frames = codec.feed("ult\":true}\n{\"id\"");
    REQUIRE(frames.size() == 1);
    CHECK(frames[0]["id"] == 1);
    CHECK(frames[0]["result"] == true);
    CHECK(codec.bufferedSize() == 5);
}

TEST_CASE("FrameCodec output does not depend on chunk boundaries", "[codec]")
{
    auto const stream = std::string("{\"jsonrpc\":\"2.0\",\"id\":7,\"result\":{\"text\":\"h\\u00e9llo\"}}\n"
                                    "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/progress\"}\n");

    auto whole = FrameCodec {};
    auto const expected = whole.feed(stream);
    REQUIRE(expected.size() == 2);

    for (auto chunkSize: { size_t { 1 }, size_t { 2 }, size_t { 3 }, size_t { 7 }, size_t { 64 } })
    {
        auto codec = FrameCodec {};
        auto frames = std::vector<nlohmann::json> {};
        for (size_t offset = 0; offset < stream.size(); offset += chunkSize)
        {
            for (auto& frame: codec.feed(std::string_view(stream).substr(offset, chunkSize)))
                frames.push_back(std::move(frame));
        }
        CHECK(frames == expected);
        CHECK(codec.bufferedSize() == 0);
    }
}

TEST_CASE("FrameCodec strips carriage returns and skips blank lines", "[codec]")
{
    auto codec = FrameCodec {};
    auto const frames = codec.feed("\r\n{\"x\":1}\r\n\n");

    REQUIRE(frames.size() == 1);
    CHECK(frames[0]["x"] == 1);
    CHECK(codec.droppedLines() == 0);
}

TEST_CASE("FrameCodec drops lines that are not JSON", "[codec]")
{
    auto codec = FrameCodec {};
    auto const frames = codec.feed("Server listening on stdio\n{\"ok\":true}\n{broken\n");

    REQUIRE(frames.size() == 1);
    CHECK(frames[0]["ok"] == true);
    CHECK(codec.droppedLines() == 2);
}

TEST_CASE("FrameCodec reset discards the partial line", "[codec]")
{
    auto codec = FrameCodec {};
    CHECK(codec.feed("{\"stale\":").empty());
    codec.reset();
    CHECK(codec.bufferedSize() == 0);

    auto const frames = codec.feed("{\"fresh\":1}\n");
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].contains("fresh"));
}
