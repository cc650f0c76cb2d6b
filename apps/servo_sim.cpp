#include "lasertrack/actuator/ActuatorConfig.hpp"
#include "lasertrack/actuator/SimulatedServoController.hpp"
#include "lasertrack/log/Log.hpp"
#include "lasertrack/net/NetConfig.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

using namespace lasertrack;
using lasertrack::net::tcp;
namespace asio = lasertrack::net::asio;

namespace {

// One controller connection: read a line, answer it, repeat until "quit" or EOF.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket socket, actuator::SimulatedServoController& controller)
    : socket_(std::move(socket))
    , controller_(controller) {}

    void start() { readLine(); }

private:
    void readLine() {
        auto self = shared_from_this();
        asio::async_read_until(socket_, asio::dynamic_buffer(buffer_, 256), '\n',
            [this, self](const std::error_code& ec, std::size_t length) {
                if (ec) {
                    if (ec != asio::error::eof) {
                        logError("[servo_sim] read: ", ec.message(), "\n");
                    }
                    return;
                }
                std::string line = buffer_.substr(0, length - 1);
                buffer_.erase(0, length);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }

                auto reply = controller_.handle(line);
                logDebug("[servo_sim] '", line, "' -> '", reply.line, "'\n");
                writeReply(reply.line + '\n', reply.closeConnection);
            });
    }

    void writeReply(std::string text, bool closeAfter) {
        auto self = shared_from_this();
        auto out = std::make_shared<std::string>(std::move(text));
        asio::async_write(socket_, asio::buffer(*out),
            [this, self, out, closeAfter](const std::error_code& ec, std::size_t) {
                if (ec) {
                    logError("[servo_sim] write: ", ec.message(), "\n");
                    return;
                }
                if (closeAfter) {
                    std::error_code ignored;
                    socket_.shutdown(tcp::socket::shutdown_both, ignored);
                    socket_.close(ignored);
                    return;
                }
                readLine();
            });
    }

    tcp::socket socket_;
    actuator::SimulatedServoController& controller_;
    std::string buffer_;
};

class Server {
public:
    Server(asio::io_context& io, unsigned short port, actuator::SimulatedServoController& controller)
    : acceptor_(io, tcp::endpoint(tcp::v4(), port))
    , ticker_(io)
    , controller_(controller) {}

    void start() {
        accept();
        tick();
    }

private:
    void accept() {
        acceptor_.async_accept([this](const std::error_code& ec, tcp::socket socket) {
            if (!ec) {
                std::error_code ignored;
                logInfo("[servo_sim] client ", socket.remote_endpoint(ignored).address().to_string(), "\n");
                socket.set_option(tcp::no_delay(true), ignored);
                std::make_shared<Connection>(std::move(socket), controller_)->start();
            } else if (ec == asio::error::operation_aborted) {
                return;
            } else {
                logError("[servo_sim] accept: ", ec.message(), "\n");
            }
            accept();
        });
    }

    void tick() {
        ticker_.expires_after(actuator::config::SIM_SELF_TEST_TICK);
        ticker_.async_wait([this](const std::error_code& ec) {
            if (ec) return;
            controller_.tickSelfTest();
            tick();
        });
    }

    tcp::acceptor acceptor_;
    asio::steady_timer ticker_;
    actuator::SimulatedServoController& controller_;
};

} // namespace

int main(int argc, char** argv) {
    const auto port = static_cast<unsigned short>(
        argc > 1 ? std::atoi(argv[1]) : actuator::config::ACTUATOR_PORT_DEFAULT);

    if (const char* debug = std::getenv("LASERTRACK_DEBUG"); debug && *debug && *debug != '0') {
        log::setMinimumLevel(log::Level::Debug);
    }

    actuator::SimulatedServoController controller;
    const auto limits = controller.limits();

    try {
        asio::io_context io;
        Server server(io, port, controller);
        server.start();

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const std::error_code&, int) { io.stop(); });

        std::cout << "Simulated servo controller on port " << port
                  << " h=[" << limits.horizontal.min << "," << limits.horizontal.max << "]"
                  << " v=[" << limits.vertical.min << "," << limits.vertical.max << "]" << std::endl;
        io.run();
    } catch (const std::system_error& e) {
        std::cerr << "servo_sim: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Done. " << controller.requestsHandled() << " requests handled." << std::endl;
    return 0;
}
