/**
 * @file link_test_example.cpp
 * @brief Link test between two loopback radios, one echoing the other
 *
 * Usage: link_test_example [capture.pcap]
 *
 * With a capture file, the session log is written next to it
 * (capture.pcap logs to capture.log).
 */
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "radiohal.hpp"

using namespace radiohal;

#define LINK_TEST_ROUNDS 10
#define LINK_TEST_POWER 10
#define LINK_TEST_RSSI -72
#define LINK_TEST_LQI 190

int main(int argc, char** argv) {
    LOG.SetLogLevel(LogLevel::kInfo);

    hal::NativeHal& hal = hal::GetNativeHal();

    if (argc > 1) {
        try {
            LOG.SetHandler(CreateSessionLogHandler(argv[1], hal));
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
        std::cout << "Logging to " << SessionLogPath(argv[1]) << std::endl;
    }
    auto medium = std::make_shared<LoopbackMedium>(LINK_TEST_RSSI, LINK_TEST_LQI);

    LoopbackRadio local(medium, hal);
    LoopbackRadio remote(medium, hal);

    ChannelConfig config = ChannelConfig::CreateDefaultEu868();
    Result status = local.Configure(config);
    if (status) {
        status = remote.Configure(config);
    }
    if (!status) {
        LOG_ERROR("Configuration failed: %s", status.GetErrorMessage().c_str());
        return 1;
    }

    helpers::EchoOptions echo;
    echo.continuous = true;
    echo.max_packets = LINK_TEST_ROUNDS;
    echo.append_info = true;
    echo.delay = std::chrono::milliseconds(5);

    std::thread echo_thread([&remote, &echo, &hal]() {
        auto echoed = helpers::DoEcho(remote, echo, hal);
        if (!echoed) {
            LOG_ERROR("Echo stopped: %s",
                      echoed.getStatus().GetErrorMessage().c_str());
        }
    });

    helpers::PingPongOptions ping_pong;
    ping_pong.rounds = LINK_TEST_ROUNDS;
    ping_pong.power = LINK_TEST_POWER;
    ping_pong.delay = std::chrono::milliseconds(5);
    ping_pong.parse_info = true;

    auto info = helpers::DoPingPong(local, ping_pong, hal);
    echo_thread.join();

    if (!info) {
        LOG_ERROR("Link test failed: %s",
                  info.getStatus().GetErrorMessage().c_str());
        return 1;
    }

    std::cout << "Received " << info.getValue().received << "/"
              << info.getValue().sent << std::endl;
    std::cout << "Local rssi:  " << info.getValue().local_rssi.ToString()
              << std::endl;
    std::cout << "Remote rssi: " << info.getValue().remote_rssi.ToString()
              << std::endl;

    // Capture one more packet when an output file is given
    if (argc > 1) {
        helpers::TransmitOptions hello;
        hello.data = {'h', 'e', 'l', 'l', 'o'};
        status = helpers::DoTransmit(remote, hello, hal);
        if (!status) {
            return 1;
        }

        helpers::ReceiveOptions receive;
        receive.pcap.file = std::string(argv[1]);
        auto received = helpers::DoReceive(local, receive, hal);
        if (!received) {
            LOG_ERROR("Capture failed: %s",
                      received.getStatus().GetErrorMessage().c_str());
            return 1;
        }
    }

    LOG_FLUSH();
    return 0;
}
