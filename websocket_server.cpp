#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <atomic>
#include <algorithm>
#include <vector>
#include <nlohmann/json.hpp>

#include "src/attendance/errors.hpp"
#include "src/recognizer/engine_factory.hpp"
#include "src/utils/base64.hpp"
#include "src/utils/config.hpp"
#include "src/utils/date_utils.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using json = nlohmann::json;

// Statistics structure
struct ServerStats {
    std::atomic<uint64_t> submissions{0};
    std::atomic<uint64_t> failed_submissions{0};
    std::atomic<uint64_t> faces_processed{0};
    std::atomic<uint64_t> recognitions{0};
    std::atomic<uint64_t> enrollments{0};

    json toJSON() const {
        return json{
            {"submissions", submissions.load()},
            {"failed_submissions", failed_submissions.load()},
            {"faces_processed", faces_processed.load()},
            {"recognitions", recognitions.load()},
            {"enrollments", enrollments.load()}
        };
    }
};

// Thrown for requests that are not well-formed.
class BadRequest : public std::runtime_error {
public:
    explicit BadRequest(const std::string& what) : std::runtime_error(what) {}
};

static std::string requireString(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw BadRequest(std::string("Missing or invalid field: ") + key);
    }
    return it->get<std::string>();
}

// WebSocket session class
class Session : public std::enable_shared_from_this<Session> {
private:
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::string response_;
    std::shared_ptr<AttendanceEngine> engine_;
    ServerStats& stats_;
    uint64_t session_id_;

public:
    Session(tcp::socket&& socket, std::shared_ptr<AttendanceEngine> engine, ServerStats& stats, uint64_t session_id)
        : ws_(std::move(socket)),
          engine_(engine),
          stats_(stats),
          session_id_(session_id) {
    }

    void run() {
        net::dispatch(
            ws_.get_executor(),
            beast::bind_front_handler(
                &Session::on_run,
                shared_from_this()
            )
        );
    }

    void on_run() {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server, "Rollcall Attendance WebSocket Server");
            }
        ));

        ws_.async_accept(
            beast::bind_front_handler(
                &Session::on_accept,
                shared_from_this()
            )
        );
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            std::cerr << "[server] Accept error: " << ec.message() << std::endl;
            return;
        }

        std::cout << "[server] Client " << session_id_ << " connected" << std::endl;
        do_read();
    }

    void do_read() {
        ws_.async_read(
            buffer_,
            beast::bind_front_handler(
                &Session::on_read,
                shared_from_this()
            )
        );
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec == websocket::error::closed) {
            std::cout << "[server] Client " << session_id_ << " disconnected" << std::endl;
            return;
        }

        if (ec) {
            std::cerr << "[server] Read error: " << ec.message() << std::endl;
            return;
        }

        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        // The buffer must outlive async_write.
        response_ = processMessage(message);

        ws_.text(true);
        ws_.async_write(
            net::buffer(response_),
            beast::bind_front_handler(
                &Session::on_write,
                shared_from_this()
            )
        );
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec) {
            std::cerr << "[server] Write error: " << ec.message() << std::endl;
            return;
        }

        do_read();
    }

    std::string processMessage(const std::string& message) {
        json request_id;
        try {
            json data = json::parse(message);
            if (!data.is_object()) {
                throw BadRequest("Request must be a JSON object");
            }
            if (data.contains("request_id")) {
                request_id = data["request_id"];
            }

            std::string type = data.value("type", "");
            json response;
            if (type == "submit_attendance") {
                response = handleSubmit(data);
            } else if (type == "enroll") {
                response = handleEnroll(data);
            } else if (type == "remove_enrollment") {
                response = handleRemove(data);
            } else if (type == "get_attendance") {
                response = handleGetAttendance(data);
            } else if (type == "get_stats") {
                response = json{{"type", "stats"}, {"stats", stats_.toJSON()}};
            } else {
                throw BadRequest("Unknown message type: " + type);
            }

            if (!request_id.is_null()) {
                response["request_id"] = request_id;
            }
            return response.dump();

        } catch (const json::exception& e) {
            return buildErrorResponse(request_id, std::string("Malformed JSON: ") + e.what());
        } catch (const BadRequest& e) {
            return buildErrorResponse(request_id, e.what());
        } catch (const RegistryUnavailableError& e) {
            std::cerr << "[server] Registry error: " << e.what() << std::endl;
            return buildErrorResponse(request_id, std::string("Face registry unavailable: ") + e.what());
        } catch (const StorageError& e) {
            std::cerr << "[server] Storage error: " << e.what() << std::endl;
            return buildErrorResponse(request_id, std::string("Attendance store unavailable: ") + e.what());
        } catch (const std::exception& e) {
            std::cerr << "[server] Message processing error: " << e.what() << std::endl;
            return buildErrorResponse(request_id, std::string("Processing error: ") + e.what());
        }
    }

    json handleSubmit(const json& data) {
        SessionContext session;
        session.class_id = requireString(data, "class_id");
        session.date = data.contains("date") ? requireString(data, "date") : currentDate();
        if (!isValidDate(session.date)) {
            throw BadRequest("date must be YYYY-MM-DD");
        }
        session.marked_by = data.value("marked_by", "");
        session.threshold = engine_->settings().match.threshold;
        if (data.contains("threshold")) {
            if (!data["threshold"].is_number()) {
                throw BadRequest("threshold must be a number");
            }
            session.threshold = data["threshold"].get<float>();
            if (!isUnitInterval(session.threshold)) {
                throw BadRequest("threshold must be within [0, 1]");
            }
        }

        std::vector<uint8_t> image = Base64::decode(requireString(data, "image"));
        SubmissionResult result = engine_->submit(image, session);

        stats_.submissions++;
        if (!result.success) {
            stats_.failed_submissions++;
        }
        stats_.faces_processed += static_cast<uint64_t>(result.faces_detected);
        stats_.recognitions += static_cast<uint64_t>(result.faces_recognized);

        json response = result;
        response["type"] = "attendance_result";
        return response;
    }

    json handleEnroll(const json& data) {
        std::string identity_id = requireString(data, "identity_id");
        std::vector<uint8_t> image = Base64::decode(requireString(data, "image"));
        EnrollmentResult result = engine_->enroll(identity_id, image);
        if (result.success) {
            stats_.enrollments++;
        }

        json response = result;
        response["type"] = "enrollment_result";
        return response;
    }

    json handleRemove(const json& data) {
        std::string identity_id = requireString(data, "identity_id");
        bool removed = engine_->removeEnrollment(identity_id);
        return json{{"type", "enrollment_removed"}, {"identity_id", identity_id}, {"removed", removed}};
    }

    json handleGetAttendance(const json& data) {
        std::string class_id = requireString(data, "class_id");
        std::string date = data.contains("date") ? requireString(data, "date") : currentDate();
        if (!isValidDate(date)) {
            throw BadRequest("date must be YYYY-MM-DD");
        }
        return json{
            {"type", "attendance"},
            {"class_id", class_id},
            {"date", date},
            {"records", engine_->sessionRecords(class_id, date)}
        };
    }

    std::string buildErrorResponse(const json& request_id, const std::string& error_message) {
        json response{{"type", "error"}, {"error", error_message}};
        if (!request_id.is_null()) {
            response["request_id"] = request_id;
        }
        return response.dump();
    }
};

// Listener class
class Listener : public std::enable_shared_from_this<Listener> {
private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<AttendanceEngine> engine_;
    ServerStats& stats_;
    std::atomic<uint64_t> session_counter_{0};

public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<AttendanceEngine> engine, ServerStats& stats)
        : ioc_(ioc),
          acceptor_(net::make_strand(ioc)),
          engine_(engine),
          stats_(stats) {

        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Open error: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Set option error: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Bind error: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Listen error: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

private:
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(
                &Listener::on_accept,
                shared_from_this()
            )
        );
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            std::cerr << "[server] Accept error: " << ec.message() << std::endl;
        } else {
            uint64_t session_id = ++session_counter_;
            std::make_shared<Session>(std::move(socket), engine_, stats_, session_id)->run();
        }

        do_accept();
    }
};

int main(int argc, char* argv[]) {
    try {
        Config config;
        std::string config_file = "config.ini";
        if (argc > 1) {
            config_file = argv[1];
        }
        if (!config.load(config_file)) {
            return 1;
        }

        std::cout << "Initializing attendance engine..." << std::endl;
        std::shared_ptr<AttendanceEngine> engine = buildEngine(config);

        ServerStats stats;

        auto const num_threads = std::max<int>(1, std::thread::hardware_concurrency());
        net::io_context ioc{num_threads};

        auto const address = net::ip::make_address(config.server_host);
        auto const port = static_cast<unsigned short>(config.server_port);

        std::cout << "Starting WebSocket server on " << config.server_host << ":" << config.server_port << std::endl;

        std::make_shared<Listener>(
            ioc,
            tcp::endpoint{address, port},
            engine,
            stats
        )->run();

        std::cout << "Server started successfully with " << num_threads << " threads" << std::endl;

        std::vector<std::thread> threads;
        threads.reserve(num_threads - 1);
        for (int i = 0; i < num_threads - 1; ++i) {
            threads.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
