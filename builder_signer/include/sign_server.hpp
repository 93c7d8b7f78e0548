#pragma once
#include "builder_signer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

struct SignSession;

// Blocking HTTP/1.1 server exposing POST /sign and GET /sign.
// Each connection is served on its own thread and is closed after
// kReadTimeoutMs without a complete request. run() returns once `running`
// is cleared; open connections are shut down at that point.
class SignServer {
public:
    static constexpr std::int64_t kReadTimeoutMs = 30000;

    // signer == nullptr serves 503 on POST /sign
    SignServer(std::uint16_t port, IBuilderHeaderSigner* signer, std::atomic<bool>& running);
    ~SignServer();

    void run();

private:
    void close_sessions(bool all);
    std::size_t open_sessions() const;

    std::uint16_t port_;
    IBuilderHeaderSigner* signer_;
    std::atomic<bool>& running_;

    mutable std::mutex sessions_mtx_;
    std::map<std::uint64_t, std::shared_ptr<SignSession>> sessions_;
};
