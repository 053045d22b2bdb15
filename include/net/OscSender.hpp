#pragma once

#include <thread>
#include <atomic>
#include <memory>
#include <string>
#include <lo/lo.h>

#include "core/Types.hpp"
#include "core/Logger.hpp"

namespace net {

/**
 * Publishes MorphState snapshots over OSC on its own thread.
 *
 *   /morph/gesture    i s   gesture code, name
 *   /morph/anchor     f f f anchor in [-1, 1]
 *   /morph/particles  i     particle count
 *   /morph/override   i f   forced flag, seconds remaining
 *   /morph/text       s     custom display text
 */
class OscSender {
public:
    OscSender(std::shared_ptr<core::StateQueue> inputQueue, const std::string& host, const std::string& port);
    ~OscSender();

    /**
     * @return false if the OSC address could not be created (logged)
     */
    bool start();
    void stop();

private:
    void loop();
    void send(const core::MorphState& state);

    std::shared_ptr<core::StateQueue> _inputQueue;
    std::string _host;
    std::string _port;

    lo_address _loAddress = nullptr;

    std::atomic<bool> _running;
    std::thread _thread;
    uint64_t _sendErrors = 0;
};

} // namespace net
