#include "lasertrack/actuator/TcpActuatorLink.hpp"
#include "lasertrack/core/Errors.hpp"
#include "lasertrack/core/Frame.hpp"
#include "lasertrack/log/Log.hpp"
#include "lasertrack/session/SessionRunner.hpp"
#include "lasertrack/session/TargetSpec.hpp"

#include <opencv2/videoio.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace lasertrack;

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " <controller-host> [port] [camera-index] [target-x target-y]\n"
              << "  target defaults to the centre of the frame (0.5 0.5)\n"
              << "  LASERTRACK_DEBUG=1 logs every detection and correction\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }

    const std::string host = argv[1];
    const auto port = static_cast<unsigned short>(
        argc > 2 ? std::atoi(argv[2]) : actuator::config::ACTUATOR_PORT_DEFAULT);
    const int cameraIndex = argc > 3 ? std::atoi(argv[3]) : 0;

    log::setTimestamps(true);
    if (const char* debug = std::getenv("LASERTRACK_DEBUG"); debug && *debug && *debug != '0') {
        log::setMinimumLevel(log::Level::Debug);
    }

    session::TargetSpec target;
    if (argc > 5) {
        target.target = core::NormalizedPoint{std::atof(argv[4]), std::atof(argv[5])}.clamped();
    }

    // 1) Talk to the controller before touching the camera.
    actuator::TcpActuatorLink link;
    if (auto r = link.connect(host, port); !r) {
        const auto err = r.error();
        std::cerr << "Connect failed: " << err.message()
                  << " (" << err.category().name() << ":" << err.value() << ")\n";
        return 1;
    }
    if (auto version = link.queryProtocolVersion(); !version) {
        std::cerr << "Version query failed: " << version.error().message() << "\n";
        return 1;
    } else if (*version != actuator::config::ACTUATOR_PROTOCOL_VERSION) {
        std::cerr << "Controller speaks protocol v" << *version
                  << ", expected v" << actuator::config::ACTUATOR_PROTOCOL_VERSION << "\n";
        return 1;
    }

    // 2) Capture loop: publish every frame, the session only ever sees the latest.
    cv::VideoCapture capture(cameraIndex);
    if (!capture.isOpened()) {
        std::cerr << "Cannot open camera " << cameraIndex << "\n";
        return 1;
    }

    core::FrameSlot frames;
    std::atomic<bool> capturing{true};
    std::thread captureThread([&] {
        cv::Mat image;
        while (capturing) {
            if (!capture.read(image) || image.empty()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }
            frames.publish(image);
        }
    });

    // 3) One session toward the requested target.
    session::SessionRunner runner(link, frames);
    std::cout << "Targeting (" << target.target.x << ", " << target.target.y << ")..." << std::endl;
    if (auto r = runner.start(target); !r) {
        std::cerr << "Start failed: " << r.error().message() << "\n";
    }
    const auto result = runner.wait();

    capturing = false;
    captureThread.join();

    if (auto r = link.quit(); !r) {
        std::cerr << "Quit failed: " << r.error().message() << "\n";
    }

    if (!result) {
        return 1;
    }
    std::cout << "Status: " << session::toString(result->status)
              << " elapsed=" << result->elapsed.count() << "ms"
              << " writes=" << result->actuatorWrites
              << " detection failures=" << result->detectionFailures;
    if (result->finalError) {
        std::cout << " error=" << *result->finalError;
    }
    std::cout << std::endl;

    return result->status == session::SessionStatus::Converged ? 0 : 1;
}
