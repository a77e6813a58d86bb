#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

#include "server/PatchService.hpp"
#include "tools/FileSystemTools.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

class PatchServer {
public:
    PatchServer(const std::string& root, const patchwork::PatchConfig& config, int port)
        : port_(port), service_(root, config)
    {
        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Starting patch engine on 127.0.0.1:{} | WORKSPACE: {}", port_,
                     service_.resolver().root().string());
        if (!server_.listen("127.0.0.1", port_)) {
            spdlog::error("❌ Could not bind 127.0.0.1:{}", port_);
            return false;
        }
        return true;
    }

private:
    int port_;
    patchwork::PatchService service_;
    httplib::Server server_;

    static void send(httplib::Response& res, const patchwork::ServiceReply& reply) {
        res.status = reply.status;
        res.set_content(reply.body.dump(), "application/json");
    }

    void setup_routes() {
        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/tools", [this](const httplib::Request&, httplib::Response& res) {
            send(res, service_.manifest());
        });

        // ?file_path=<path> narrows the log to one target
        server_.Get("/api/admin/logs", [this](const httplib::Request& req, httplib::Response& res) {
            std::string filter = req.has_param("file_path") ? req.get_param_value("file_path") : "";
            send(res, service_.logs(filter));
        });

        server_.Post("/api/tools/:name", [this](const httplib::Request& req, httplib::Response& res) {
            send(res, service_.call_tool(req.path_params.at("name"), req.body));
        });

        server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
            std::string what;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
            spdlog::error("💥 Request failed: {}", what);
            send(res, {500, json{{"success", false}, {"message", "ERROR: " + what}}});
        });
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string root = argc > 1 ? argv[1] : fs::current_path().string();
    patchwork::PatchConfig config = patchwork::FileSystemTools::load_config(root);
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    int port = config.port;
    if (argc > 2) {
        try {
            port = std::stoi(argv[2]);
        } catch (const std::exception&) {
            spdlog::error("❌ Invalid port '{}'", argv[2]);
            return 1;
        }
    }

    PatchServer server(root, config, port);
    return server.run() ? 0 : 1;
}
