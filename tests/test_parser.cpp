#include <doctest/doctest.h>
#include "pumplink/hex.hpp"
#include "pumplink/parser.hpp"

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

using namespace pumplink;

using Bytes = std::vector<uint8_t>;

static Bytes hex(const std::string& text) {
    Bytes b;
    REQUIRE(from_hex(text, b));
    return b;
}

static ParseResult parse_hex(const std::string& text) {
    return parser::parse(hex(text));
}

// -------- captured traffic --------

TEST_CASE("MODBUS40 write poll from the heat pump") {
    ParseResult r = parse_hex("5C 00 20 6B 00 4B");
    REQUIRE(r.ok());
    CHECK(r.message.type() == Message::Type::Master);
    CHECK(r.message.address() == 0x20);
    CHECK(kind_of(r.message.command()) == CommandKind::RequestWriteNull);
    CHECK(r.message.to_bytes() == hex("5C 00 20 6B 00 4B"));
}

TEST_CASE("MODBUS40 read poll from the heat pump") {
    ParseResult r = parse_hex("5C 00 20 69 00 49");
    REQUIRE(r.ok());
    CHECK(kind_of(r.message.command()) == CommandKind::RequestReadNull);
}

TEST_CASE("a trailing byte after a complete frame is ignored") {
    ParseResult r = parse_hex("5C 00 20 6B 00 4B A8");
    REQUIRE(r.ok());
    CHECK(kind_of(r.message.command()) == CommandKind::RequestWriteNull);
}

TEST_CASE("unknown command code keeps its code") {
    ParseResult r = parse_hex("5C 00 19 60 00 79");
    REQUIRE(r.ok());
    CHECK(r.message.address() == 0x19);
    REQUIRE(kind_of(r.message.command()) == CommandKind::Unknown);
    CHECK(std::get<CommandUnknown>(r.message.command()).code == 0x60);
    CHECK(std::get<CommandUnknown>(r.message.command()).data.empty());
}

TEST_CASE("RMU40 frame") {
    ParseResult r = parse_hex("5C 00 19 62 18 00 80 00 80 00 00 00 00 00 80 00 00 00 00 00 "
                              "0B 0B 00 00 00 01 00 00 05 E7");
    REQUIRE(r.ok());
    REQUIRE(kind_of(r.message.command()) == CommandKind::ResponseRmu);
    CHECK(std::get<ResponseRmu>(r.message.command()).data.size() == 24);
}

TEST_CASE("MODBUS40 bulk data frame") {
    ParseResult r = parse_hex(
        "5C 00 20 68 50 01 A8 1F 01 00 A8 64 00 FD A7 D0 03 44 9C 1E 00 4F 9C A0 00 50 9C "
        "78 00 51 9C 03 01 52 9C 1B 01 87 9C 14 01 4E 9C C6 01 47 9C 01 01 15 B9 B0 FF 3A "
        "B9 4B 00 C9 AF 00 00 48 9C 0D 01 4C 9C E7 00 4B 9C 00 00 FF FF 00 00 FF FF 00 00 "
        "FF FF 00 00 45");
    REQUIRE(r.ok());
    REQUIRE(kind_of(r.message.command()) == CommandKind::ResponseData);

    const auto& p = std::get<ResponseData>(r.message.command()).parameters;
    CHECK(p.size() == 17);
    CHECK(p.at(43009) == 287);
    CHECK(p.at(43008) == 100);
    CHECK(p.at(43005) == 976);
    CHECK(p.at(40004) == 30);
    CHECK(p.at(40015) == 160);
    CHECK(p.at(40016) == 120);
    CHECK(p.at(40017) == 259);
    CHECK(p.at(40018) == 283);
    CHECK(p.at(40071) == 276);
    CHECK(p.at(40014) == 454);
    CHECK(p.at(40007) == 257);
    CHECK(p.at(47381) == 65456);
    CHECK(p.at(47418) == 75);
    CHECK(p.at(45001) == 0);
    CHECK(p.at(40008) == 269);
    CHECK(p.at(40012) == 231);
    CHECK(p.at(40011) == 0);
}

// -------- our own requests --------

TEST_CASE("slave read and write requests encode to known frames") {
    CHECK(Message::slave(RequestRead{0x1234}).to_bytes() == hex("C0 69 02 34 12 8D"));
    CHECK(Message::slave(RequestRead{12345}).to_bytes() == hex("C0 69 02 39 30 A2"));
    CHECK(Message::slave(RequestWrite{12345, 987654}).to_bytes() == hex("C0 6B 06 39 30 06 12 0F 00 BF"));
    CHECK(Message::slave(RequestWrite{0xFFFF, 0xFFFFFFFF}).to_bytes() == hex("C0 6B 06 FF FF FF FF FF FF AD"));

    ParseResult r = parse_hex("C0 6B 06 39 30 06 12 0F 00 BF");
    REQUIRE(r.ok());
    CHECK(r.message.type() == Message::Type::Slave);
    CHECK(r.message.command() == Command{RequestWrite{12345, 987654}});
}

TEST_CASE("checksum collisions use the substitute") {
    CHECK(Message::slave(RequestRead{0x006B}).to_bytes() == hex("C0 69 02 6B 00 0C"));
    CHECK(Message::master(0x20, ResponseWrite{0x0012}).to_bytes() == hex("5C 00 20 6C 02 12 00 C5"));

    ParseResult r = parse_hex("C0 69 02 6B 00 0C");
    REQUIRE(r.ok());
    CHECK(r.message.command() == Command{RequestRead{0x006B}});

    r = parse_hex("5C 00 20 6C 02 12 00 C5");
    REQUIRE(r.ok());
    CHECK(r.message.command() == Command{ResponseWrite{0x0012}});
}

TEST_CASE("key bytes inside a frame are escaped and unescaped") {
    CHECK(Message::slave(RequestWrite{0x00C0, 0}).to_bytes() == hex("C0 6B 06 C0 C0 00 00 00 00 00 6D"));
    CHECK(Message::master(0x5C, RequestReadNull{}).to_bytes() == hex("5C 00 5C 5C 69 00 35"));

    ParseResult r = parse_hex("5C 00 5C 5C 69 00 35");
    REQUIRE(r.ok());
    CHECK(r.message.address() == 0x5C);

    r = parse_hex("5C 00 20 6A 06 5C 5C 00 01 00 00 00 11");
    REQUIRE(r.ok());
    CHECK(r.message.command() == Command{ResponseRead{0x005C, 1}});
}

TEST_CASE("product response frame") {
    ResponseProduct p;
    p.unknown[0] = 1; p.unknown[1] = 2; p.unknown[2] = 3;
    p.product = "SMO40";
    const Message m = Message::master(0x20, p);
    CHECK(m.to_bytes() == hex("5C 00 20 6D 08 01 02 03 53 4D 4F 34 30 10"));

    ParseResult r = parser::parse(m.to_bytes());
    REQUIRE(r.ok());
    CHECK(r.message == m);
}

TEST_CASE("every command kind survives encode and parse at its boundaries") {
    ResponseData data;
    data.parameters[0] = 0;
    data.parameters[0xFFFE] = 0xFFFF;

    ResponseRmu rmu;
    for (int i = 0; i < 3; ++i) rmu.data.push_back(0x5C);

    ResponseProduct product;
    product.product = "F1245";

    CommandUnknown unknown;
    unknown.code = 0xC0;
    unknown.data.push_back(0xC0);

    const std::vector<Command> commands{
        RequestReadNull{},  RequestRead{0},          RequestRead{0xFFFF},
        RequestWriteNull{}, RequestWrite{0, 0},      RequestWrite{0xFFFF, 0xFFFFFFFF},
        ResponseRead{0, 0}, ResponseRead{0xFFFF, 0xFFFFFFFF},
        ResponseWrite{0},   ResponseWrite{0xFFFF},
        data, ResponseData{}, rmu, product, unknown,
    };

    for (const auto& c : commands) {
        CAPTURE(describe(c));
        for (const Message& m : {Message::master(0x20, c), Message::slave(c)}) {
            ParseResult r = parser::parse(m.to_bytes());
            REQUIRE(r.ok());
            CHECK(r.message == m);
        }
    }
}

// -------- bare messages --------

TEST_CASE("ack, nak and unknown start bytes") {
    ParseResult r = parse_hex("06");
    REQUIRE(r.ok());
    CHECK(r.message.type() == Message::Type::Ack);
    CHECK_FALSE(r.message.has_command());
    CHECK(r.message.to_bytes() == Bytes{0x06});

    r = parse_hex("15");
    REQUIRE(r.ok());
    CHECK(r.message.type() == Message::Type::Nak);
    CHECK(r.message.to_bytes() == Bytes{0x15});

    r = parse_hex("AA 01 02");
    REQUIRE(r.ok());
    CHECK(r.message.type() == Message::Type::Unknown);
    CHECK(r.message.start() == 0xAA);
    CHECK(r.message.data() == Bytes{0x01, 0x02});
    CHECK(r.message.to_bytes() == hex("AA 01 02"));
}

// -------- malformed input --------

TEST_CASE("empty datagram") {
    ParseResult r = parser::parse(Bytes{});
    CHECK(r.status == ParseStatus::EmptyPacket);
}

TEST_CASE("truncated frames are length errors") {
    CHECK(parse_hex("5C 00 20").status == ParseStatus::BadLength);
    CHECK(parse_hex("C0 69").status == ParseStatus::BadLength);

    ParseResult r = parse_hex("5C 00 20 6A 06 D2 04");
    CHECK(r.status == ParseStatus::BadLength);
    CHECK(r.detail == "invalid packet length: 5C 00 20 6A 06 D2 04");

    // checksum byte missing
    CHECK(parse_hex("C0 69 02 34 12").status == ParseStatus::BadLength);
}

TEST_CASE("corrupted checksum") {
    ParseResult r = parse_hex("C0 69 02 34 12 8E");
    CHECK(r.status == ParseStatus::BadChecksum);
    CHECK(r.detail == "invalid checksum 8D expected 8E");

    CHECK(parse_hex("5C 00 20 69 00 4A").status == ParseStatus::BadChecksum);
}

TEST_CASE("payload shape errors carry the raw frame") {
    ParseResult r = parse_hex("5C 00 20 6A 04 D2 04 2E 16 A0");
    CHECK(r.status == ParseStatus::BadLength);
    CHECK(r.detail == "length is not 6: 4 (5C 00 20 6A 04 D2 04 2E 16 A0)");

    CHECK(parse_hex("5C 00 20 68 03 01 02 03 4B").status == ParseStatus::BadLength);
    CHECK(parse_hex("5C 00 20 6D 04 01 02 03 80 C9").status == ParseStatus::BadPayload);
}

// -------- renderings --------

TEST_CASE("describe gives a one-line summary") {
    ParseResult r = parse_hex("5C 00 20 6A 06 44 9C 1E 00 00 00 8A");
    REQUIRE(r.ok());
    CHECK(parser::describe(r.message) == "type=master addr=0x20 cmd=read_response reg=40004 value=30");
    CHECK(parser::describe(Message::ack()) == "type=ack");
}

TEST_CASE("to_json keeps the whole product name") {
    ResponseProduct p;
    p.product.push_back('A');
    p.product.push_back('\0');
    p.product.push_back('B');

    const auto j = nlohmann::json::parse(parser::to_json(Message::master(0x20, p)));
    const std::string name = j["command"]["product"].get<std::string>();
    REQUIRE(name.size() == 3);
    CHECK(name[1] == '\0');
    CHECK(name[2] == 'B');
}

TEST_CASE("to_json exposes the decoded fields") {
    ParseResult r = parse_hex("5C 00 20 68 0C 44 9C 1E 00 FF FF 00 00 48 9C 0D 01 5A");
    REQUIRE(r.ok());

    const auto j = nlohmann::json::parse(parser::to_json(r.message));
    CHECK(j["type"] == "master");
    CHECK(j["address"] == 0x20);
    CHECK(j["command"]["kind"] == "data_response");
    CHECK(j["command"]["code"] == 0x68);
    CHECK(j["command"]["parameters"]["40004"] == 30);
    CHECK(j["command"]["parameters"]["40008"] == 269);
    CHECK(j["command"]["parameters"].size() == 2);
}
