// main.cpp
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <fstream>
#include <cstdlib> // For std::getenv
#include <memory>  // For std::make_shared
#include <optional>
#include <algorithm>

// Crow includes
#include <crow.h>
#include <crow/multipart.h> // For multipart/form-data parsing

#include <nlohmann/json.hpp>

// Our project includes
#include "transfer_engine.hpp"
#include "request_params.hpp"
#include "source_scanner.hpp"
#include "vault_config.hpp"
#include "vault_errors.hpp"

namespace fs = std::filesystem;
using namespace MediaVault;

namespace {

const uint16_t DEFAULT_PORT = 8765;

crow::response jsonResponse(int code, const nlohmann::json& body) {
    crow::response res(code, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

crow::response errorResponse(int code, const std::string& message) {
    return jsonResponse(code, {{"error", message}});
}

// Runs a handler and maps engine errors to HTTP status codes.
template<class Handler>
crow::response guarded(const char* what, Handler&& handler) {
    try {
        return handler();
    } catch (const Errors::SessionNotFound& e) {
        return errorResponse(404, e.what());
    } catch (const Errors::ExpiredSession& e) {
        return errorResponse(410, e.what());
    } catch (const Errors::SessionClosed& e) {
        return errorResponse(409, e.what());
    } catch (const Errors::IncompleteSession& e) {
        return errorResponse(409, e.what());
    } catch (const Errors::InvalidRange& e) {
        return errorResponse(416, e.what());
    } catch (const Errors::ChecksumMismatch& e) {
        return errorResponse(422, e.what());
    } catch (const Errors::RecordNotFound& e) {
        return errorResponse(404, e.what());
    } catch (const nlohmann::json::exception& e) {
        return errorResponse(400, std::string("Bad Request: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "Error during " << what << ": " << e.what() << std::endl;
        return errorResponse(500, std::string("Internal Server Error: ") + e.what());
    }
}

Config::EngineConfig loadConfig(const std::string& explicit_path) {
    std::string path = explicit_path;
    if (path.empty()) {
        const char* env = std::getenv("MEDIA_VAULT_CONFIG");
        if (env) {
            path = env;
        } else if (fs::exists("config.json")) {
            path = "config.json";
        }
    }
    if (path.empty()) {
        std::cout << "No config file given, using defaults." << std::endl;
        return Config::EngineConfig();
    }
    std::cout << "Loading config from " << path << std::endl;
    return Config::EngineConfig::loadFromFile(path);
}

void printUsage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " [serve] [config.json]              Run the upload server\n"
              << "  " << prog << " backup <dir> [device] [config.json] Back up a mounted folder\n"
              << "  " << prog << " verify <fingerprint> [config.json]\n"
              << "  " << prog << " restore <fingerprint> <dir> [config.json]\n"
              << "  " << prog << " stats [config.json]\n"
              << "  " << prog << " purge [config.json]                 Drop finished sessions past retention\n";
}

int runBackup(Engine::TransferEngine& engine, const fs::path& dir, const std::string& device) {
    std::vector<Sources::SourceFile> sources = Sources::scanDirectory(dir);
    Engine::BatchSummary summary = engine.submitBatch(sources, device);
    std::cout << summary.toJson().dump(2) << std::endl;
    return summary.failed == 0 ? 0 : 2;
}

int runServer(std::shared_ptr<Engine::TransferEngine> engine, uint16_t port) {
    crow::SimpleApp app;

    // --- POST /upload/session: open a chunked upload ---
    // Body: {"filename": "...", "size": N, "capture_time": T?, "device": "..."?}
    CROW_ROUTE(app, "/upload/session").methods("POST"_method)
    ([engine](const crow::request& req) {
        return guarded("session open", [&] {
            nlohmann::json body = nlohmann::json::parse(req.body);
            std::string filename = body.at("filename").get<std::string>();
            uint64_t size = body.at("size").get<uint64_t>();
            int64_t capture_time = body.value("capture_time", int64_t(0));
            std::string device = body.value("device", std::string());

            std::string token = engine->openSession(size, filename, capture_time, device);
            return jsonResponse(201, {
                {"token", token},
                {"chunk_size", engine->config().chunk_size},
                {"expires_in", engine->config().session_timeout_seconds}});
        });
    });

    // --- PUT /upload/chunk/<token>?offset=N: raw body is the chunk ---
    // Optional X-Chunk-SHA256 header is checked against the body.
    CROW_ROUTE(app, "/upload/chunk/<string>").methods("PUT"_method)
    ([engine](const crow::request& req, std::string token) {
        return guarded("chunk upload", [&] {
            const char* offset_param = req.url_params.get("offset");
            if (!offset_param) {
                return errorResponse(400, "Bad Request: 'offset' query parameter missing.");
            }
            std::optional<uint64_t> offset = Requests::parseOffset(offset_param);
            if (!offset) {
                return errorResponse(400, "Bad Request: 'offset' must be a non-negative integer.");
            }
            std::vector<char> bytes(req.body.begin(), req.body.end());
            Engine::ChunkAck ack = engine->writeChunk(token, *offset, std::move(bytes), req.get_header_value("X-Chunk-SHA256"));
            return jsonResponse(200, ack.toJson());
        });
    });

    // --- POST /upload/finalize/<token> ---
    CROW_ROUTE(app, "/upload/finalize/<string>").methods("POST"_method)
    ([engine](const crow::request& req, std::string token) {
        return guarded("finalize", [&] {
            Engine::SubmitResult result = engine->finalize(token);
            int code = result.outcome == Metadata::Outcome::Stored ? 201 :
                       result.outcome == Metadata::Outcome::Duplicate ? 200 : 500;
            return jsonResponse(code, result.toJson());
        });
    });

    // --- GET /upload/status/<token> ---
    CROW_ROUTE(app, "/upload/status/<string>")
    ([engine](const crow::request& req, std::string token) {
        return guarded("status", [&] {
            Metadata::UploadSessionRecord session = engine->sessionStatus(token);
            nlohmann::json j = session;
            return jsonResponse(200, j);
        });
    });

    // --- DELETE /upload/<token>: abort ---
    CROW_ROUTE(app, "/upload/<string>").methods("DELETE"_method)
    ([engine](const crow::request& req, std::string token) {
        return guarded("abort", [&] {
            if (engine->abortSession(token)) {
                return crow::response(204);
            }
            return errorResponse(409, "Upload session " + token + " already finished.");
        });
    });

    // --- POST /upload: whole file as multipart/form-data (field "file") ---
    CROW_ROUTE(app, "/upload").methods("POST"_method)
    ([engine](const crow::request& req) {
        if (req.get_header_value("Content-Type").rfind("multipart/form-data", 0) != 0) {
            return errorResponse(400, "Bad Request: Expected multipart/form-data.");
        }
        return guarded("upload", [&] {
            crow::multipart::message multipart_data(req);
            const crow::multipart::part* file_part = nullptr;
            std::string device;
            std::string filename;
            for (const auto& part : multipart_data.parts) {
                const auto& disposition = part.get_header_object("Content-Disposition");
                auto name_it = disposition.params.find("name");
                if (name_it == disposition.params.end()) {
                    continue;
                }
                if (name_it->second == "file") {
                    file_part = &part;
                    auto filename_it = disposition.params.find("filename");
                    if (filename_it != disposition.params.end()) {
                        filename = filename_it->second;
                    }
                } else if (name_it->second == "device") {
                    device = part.body;
                }
            }
            if (!file_part) {
                return errorResponse(400, "Bad Request: 'file' part missing in multipart/form-data.");
            }
            if (filename.empty()) {
                filename = "upload.bin";
            }

            // Reuse the chunked path, one chunk_size piece at a time.
            const std::string& body = file_part->body;
            const size_t chunk_size = engine->config().chunk_size;
            std::string token = engine->openSession(body.size(), filename, 0, device);
            for (size_t offset = 0; offset < body.size(); offset += chunk_size) {
                const size_t length = std::min(chunk_size, body.size() - offset);
                engine->writeChunk(token, offset, std::vector<char>(body.begin() + offset, body.begin() + offset + length));
            }
            Engine::SubmitResult result = engine->finalize(token);
            int code = result.outcome == Metadata::Outcome::Stored ? 201 :
                       result.outcome == Metadata::Outcome::Duplicate ? 200 : 500;
            return jsonResponse(code, result.toJson());
        });
    });

    // --- GET /files/<fingerprint>/verify ---
    CROW_ROUTE(app, "/files/<string>/verify")
    ([engine](const crow::request& req, std::string fingerprint) {
        return guarded("verify", [&] {
            bool ok = engine->verifyStored(fingerprint);
            return jsonResponse(ok ? 200 : 409, {{"fingerprint", fingerprint}, {"intact", ok}});
        });
    });

    CROW_ROUTE(app, "/progress")
    ([engine]() {
        return jsonResponse(200, engine->progress().toJson());
    });

    CROW_ROUTE(app, "/stats")
    ([engine]() {
        return guarded("stats", [&] {
            return jsonResponse(200, engine->statistics().toJson());
        });
    });

    CROW_ROUTE(app, "/health")
    ([]() {
        return jsonResponse(200, {{"status", "ok"}});
    });

    std::cout << "Starting Media Vault upload service on http://0.0.0.0:" << port << std::endl;
    app.port(port).multithreaded().run();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string command = args.empty() ? "serve" : args[0];
    if (command.size() > 5 && command.substr(command.size() - 5) == ".json") {
        // Bare config path: serve with it.
        args.insert(args.begin(), "serve");
        command = "serve";
    }
    auto arg = [&args](size_t i) { return i < args.size() ? args[i] : std::string(); };

    try {
        if (command == "serve") {
            auto engine = std::make_shared<Engine::TransferEngine>(loadConfig(arg(1)));
            uint16_t port = DEFAULT_PORT;
            if (const char* env_port = std::getenv("MEDIA_VAULT_PORT")) {
                port = static_cast<uint16_t>(std::stoi(env_port));
            }
            return runServer(engine, port);
        }
        if (command == "backup") {
            if (args.size() < 2) {
                printUsage(argv[0]);
                return 1;
            }
            Engine::TransferEngine engine(loadConfig(arg(3)));
            return runBackup(engine, arg(1), arg(2));
        }
        if (command == "verify" && args.size() >= 2) {
            Engine::TransferEngine engine(loadConfig(arg(2)));
            bool ok = engine.verifyStored(arg(1));
            std::cout << arg(1) << (ok ? " intact" : " DAMAGED") << std::endl;
            return ok ? 0 : 2;
        }
        if (command == "restore" && args.size() >= 3) {
            Engine::TransferEngine engine(loadConfig(arg(3)));
            fs::path restored = engine.restore(arg(1), arg(2));
            std::cout << restored.string() << std::endl;
            return 0;
        }
        if (command == "stats") {
            Engine::TransferEngine engine(loadConfig(arg(1)));
            std::cout << engine.statistics().toJson().dump(2) << std::endl;
            return 0;
        }
        if (command == "purge") {
            Engine::TransferEngine engine(loadConfig(arg(1)));
            engine.purgeSessionHistory(engine.config().history_retention_days);
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    printUsage(argv[0]);
    return 1;
}
