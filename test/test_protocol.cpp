#include <vector>

#include "TestUtil.hpp"
#include "pshare/Net.hpp"
#include "pshare/Protocol.hpp"

using namespace pshare;

int main() {
    // Big-endian integers
    {
        ByteWriter w;
        w.put16(0x1234).put32(0xA1B2C3D4).put64(0x0102030405060708ULL).putBool(true).putBool(false);
        std::vector<uint8_t> expect {
            0x12,0x34, 0xA1,0xB2,0xC3,0xD4,
            0x01,0x02,0x03,0x04,0x05,0x06,0x07,0x08, 1, 0
        };
        CHECK(w.bytes() == expect);
        CHECK(get16(expect.data()) == 0x1234);
        CHECK(get32(expect.data() + 2) == 0xA1B2C3D4);
        CHECK(get64(expect.data() + 6) == 0x0102030405060708ULL);
    }

    // Heartbeat carries the port and exactly the given ids
    {
        auto bytes = msg::update(6881, {3, 7, 42});
        CHECK(bytes.size() == 1 + 2 + 4 + 3 * 4);
        CHECK(bytes[0] == static_cast<uint8_t>(TrackerRequest::UPDATE));
        CHECK(get16(&bytes[1]) == 6881);
        CHECK(get32(&bytes[3]) == 3);
        CHECK(get32(&bytes[7]) == 3);
        CHECK(get32(&bytes[11]) == 7);
        CHECK(get32(&bytes[15]) == 42);

        auto none = msg::update(1, {});
        CHECK(none.size() == 7);
        CHECK(get32(&none[3]) == 0);
    }

    // Register: tag, text, size
    {
        auto bytes = msg::upload("a.txt", 100);
        std::vector<uint8_t> expect {
            static_cast<uint8_t>(TrackerRequest::UPLOAD), 0x00, 0x05, 'a','.','t','x','t',
            0,0,0,0,0,0,0,100
        };
        CHECK(bytes == expect);
    }

    // Peer requests
    {
        auto stat = msg::stat(9);
        CHECK(stat.size() == 5 && stat[0] == static_cast<uint8_t>(PeerRequest::STAT) && get32(&stat[1]) == 9);
        auto get = msg::get(9, 4);
        CHECK(get.size() == 9 && get[0] == static_cast<uint8_t>(PeerRequest::GET));
        CHECK(get32(&get[1]) == 9 && get32(&get[5]) == 4);
        CHECK(msg::listFiles().size() == 1);
        CHECK(msg::sources(12).size() == 5);
    }

    // Typed reads on a connection
    {
        auto [a, b] = testutil::connectionPair();
        ByteWriter w;
        w.put8(2).put16(65000).put32(static_cast<uint32_t>(-5)).put64(1ULL << 40)
         .putBool(true).putText("movie.mp4").putText("");
        a.send(w.bytes());
        a.close();

        CHECK(b.readU8() == 2);
        CHECK(b.readU16() == 65000);
        CHECK(b.readI32() == -5);
        CHECK(b.readI64() == (1LL << 40));
        CHECK(b.readBool());
        CHECK(b.readText() == "movie.mp4");
        CHECK(b.readText().empty());

        uint8_t tag;
        CHECK(!b.tryReadU8(tag));
        CHECK_THROWS(b.readI32(), NetError);
    }

    // A short stream is a transport fault
    {
        auto [a, b] = testutil::connectionPair();
        a.send(ByteWriter().put16(10).putBytes(reinterpret_cast<const uint8_t*>("abc"), 3).bytes());
        a.close();
        CHECK_THROWS(b.readText(), NetError);
    }

    // Nobody listening is reported as a refusal
    {
        CHECK_THROWS(Connection::connect(Endpoint{"127.0.0.1", 1}, 2), ConnectionRefused);
    }

    return 0;
}
