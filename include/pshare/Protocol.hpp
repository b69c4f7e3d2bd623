#ifndef PSHARE_PROTOCOL_HPP
#define PSHARE_PROTOCOL_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace pshare {

    // Requests understood by the tracker.
    enum class TrackerRequest : uint8_t {
        LIST = 1, UPLOAD = 2, SOURCES = 3, UPDATE = 4
    };

    // Requests understood by a seed's listener.
    enum class PeerRequest : uint8_t {
        STAT = 1, GET = 2
    };

    // Big-endian field writer. Text is a 16-bit byte length followed by the bytes.
    class ByteWriter {
    public:
        ByteWriter& put8(uint8_t v);
        ByteWriter& put16(uint16_t v);
        ByteWriter& put32(uint32_t v);
        ByteWriter& put64(uint64_t v);
        ByteWriter& putBool(bool v) { return put8(v ? 1 : 0); }
        ByteWriter& putText(const std::string& s);
        ByteWriter& putBytes(const uint8_t* data, size_t n);

        const std::vector<uint8_t>& bytes() const { return buf_; }
        std::vector<uint8_t> take() { return std::move(buf_); }

    private:
        std::vector<uint8_t> buf_;
    };

    uint16_t get16(const uint8_t* p);
    uint32_t get32(const uint8_t* p);
    uint64_t get64(const uint8_t* p);

    constexpr size_t MAX_TEXT_LEN = 0xFFFF;

    namespace msg {
        std::vector<uint8_t> listFiles();
        std::vector<uint8_t> upload(const std::string& name, int64_t size);
        std::vector<uint8_t> sources(int32_t fileId);
        std::vector<uint8_t> update(uint16_t port, const std::vector<int32_t>& fileIds);

        std::vector<uint8_t> stat(int32_t fileId);
        std::vector<uint8_t> get(int32_t fileId, int32_t partIndex);
    }

} // namespace pshare

#endif // PSHARE_PROTOCOL_HPP
