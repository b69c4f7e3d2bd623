#include "pshare/Protocol.hpp"

#include <stdexcept>

namespace pshare {

    ByteWriter& ByteWriter::put8(uint8_t v){ buf_.push_back(v); return *this; }

    ByteWriter& ByteWriter::put16(uint16_t v){
        buf_.push_back((v>>8)&0xFF); buf_.push_back(v&0xFF);
        return *this;
    }

    ByteWriter& ByteWriter::put32(uint32_t v){
        buf_.push_back((v>>24)&0xFF); buf_.push_back((v>>16)&0xFF);
        buf_.push_back((v>>8)&0xFF); buf_.push_back(v&0xFF);
        return *this;
    }

    ByteWriter& ByteWriter::put64(uint64_t v){
        put32(static_cast<uint32_t>(v >> 32));
        return put32(static_cast<uint32_t>(v & 0xFFFFFFFFu));
    }

    ByteWriter& ByteWriter::putText(const std::string& s){
        if (s.size() > MAX_TEXT_LEN) throw std::length_error("Text field longer than 65535 bytes");
        put16(static_cast<uint16_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
        return *this;
    }

    ByteWriter& ByteWriter::putBytes(const uint8_t* data, size_t n){
        buf_.insert(buf_.end(), data, data + n);
        return *this;
    }

    uint16_t get16(const uint8_t* p){ return static_cast<uint16_t>((uint16_t(p[0])<<8)|uint16_t(p[1])); }
    uint32_t get32(const uint8_t* p){ return (uint32_t(p[0])<<24)|(uint32_t(p[1])<<16)|(uint32_t(p[2])<<8)|uint32_t(p[3]); }
    uint64_t get64(const uint8_t* p){ return (uint64_t(get32(p))<<32)|uint64_t(get32(p+4)); }

    namespace msg {

        // ---- Tracker requests ----

        std::vector<uint8_t> listFiles(){
            return ByteWriter().put8(static_cast<uint8_t>(TrackerRequest::LIST)).take();
        }

        std::vector<uint8_t> upload(const std::string& name, int64_t size){
            ByteWriter w;
            w.put8(static_cast<uint8_t>(TrackerRequest::UPLOAD))
             .putText(name)
             .put64(static_cast<uint64_t>(size));
            return w.take();
        }

        std::vector<uint8_t> sources(int32_t fileId){
            ByteWriter w;
            w.put8(static_cast<uint8_t>(TrackerRequest::SOURCES)).put32(static_cast<uint32_t>(fileId));
            return w.take();
        }

        std::vector<uint8_t> update(uint16_t port, const std::vector<int32_t>& fileIds){
            ByteWriter w;
            w.put8(static_cast<uint8_t>(TrackerRequest::UPDATE))
             .put16(port)
             .put32(static_cast<uint32_t>(fileIds.size()));
            for (int32_t id : fileIds) w.put32(static_cast<uint32_t>(id));
            return w.take();
        }

        // ---- Peer requests ----

        std::vector<uint8_t> stat(int32_t fileId){
            ByteWriter w;
            w.put8(static_cast<uint8_t>(PeerRequest::STAT)).put32(static_cast<uint32_t>(fileId));
            return w.take();
        }

        std::vector<uint8_t> get(int32_t fileId, int32_t partIndex){
            ByteWriter w;
            w.put8(static_cast<uint8_t>(PeerRequest::GET))
             .put32(static_cast<uint32_t>(fileId))
             .put32(static_cast<uint32_t>(partIndex));
            return w.take();
        }

    } // namespace msg

} // namespace pshare
