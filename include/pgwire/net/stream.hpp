#ifndef PGWIRE_NET_STREAM_HPP
#define PGWIRE_NET_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace pgwire::net {

// blocking bidirectional byte stream. both calls throw on failure, never return short
class IStream {
   public:
    virtual ~IStream() = default;

    // reads exactly len bytes. a peer hang-up before that is an IoError
    virtual void read_exact(uint8_t* data, std::size_t len) = 0;
    virtual void write_all(const uint8_t* data, std::size_t len) = 0;
};

class SocketStream : public IStream {
   public:
    // takes ownership of a connected socket
    explicit SocketStream(int fd);
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;
    SocketStream(SocketStream&& other) noexcept;
    SocketStream& operator=(SocketStream&& other) noexcept;

    // resolve host and connect over TCP. timeout_seconds > 0 sets a read/write deadline
    static std::unique_ptr<SocketStream> connect(const std::string& host, uint16_t port,
                                                 int timeout_seconds = 0);

    void read_exact(uint8_t* data, std::size_t len) override;
    void write_all(const uint8_t* data, std::size_t len) override;

    void close() noexcept;
    [[nodiscard]] int fd() const noexcept {
        return fd_;
    }

   private:
    int fd_ = -1;
};

}  // namespace pgwire::net

#endif
