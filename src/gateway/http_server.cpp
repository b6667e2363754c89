#include <mcp_fleet/gateway/http_server.hpp>

#include <mcp_fleet/core/log.hpp>

#include <httplib.h>

#include <atomic>
#include <exception>
#include <thread>

namespace mcp_fleet {

namespace {

constexpr const char* kJson = "application/json";
constexpr const char* kBackendPattern = "([A-Za-z0-9_-]+)";

std::string Route(const std::string& suffix) {
    return std::string("/backends/") + kBackendPattern + suffix;
}

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(Dump(body), kJson);
}

void SendError(httplib::Response& res, const Error& error) {
    res.status = error.HttpStatus();
    res.set_content(error.ToJson(), kJson);
}

Result<nlohmann::json, Error> ParseBody(const httplib::Request& req, const char* operation) {
    if (req.body.empty()) {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json::object());
    }
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded()) {
        return Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorCategory::InvalidRequest, operation, "", "request body is not valid JSON"));
    }
    return Result<nlohmann::json, Error>::Ok(std::move(body));
}

HeaderLookup HeadersOf(const httplib::Request& req) {
    return [&req](const std::string& name) -> std::optional<std::string> {
        if (!req.has_header(name)) {
            return std::nullopt;
        }
        return req.get_header_value(name);
    };
}

size_t EffectiveThreads(const HttpServerOptions& options) {
    return options.threads < 2 ? 2 : options.threads;
}

size_t StreamCap(const HttpServerOptions& options) {
    const size_t threads = EffectiveThreads(options);
    size_t cap = options.max_streams;
    if (cap == 0) {
        cap = threads > kReservedWorkers ? threads - kReservedWorkers : 1;
    }
    return cap < threads ? cap : threads - 1;
}

std::string SseEvent(const std::string& event, const std::string& data) {
    return "event: " + event + "\ndata: " + data + "\n\n";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpServer::Impl {
    Impl(GatewayFacade& gw, const IRequestGate& g, HttpServerOptions opts)
        : gateway(gw), gate(g), options(std::move(opts)), max_streams(StreamCap(options)) {}

    GatewayFacade& gateway;
    const IRequestGate& gate;
    HttpServerOptions options;

    httplib::Server server;
    std::thread thread;
    std::atomic<bool> stopping{false};
    int bound_port = -1;
    const size_t max_streams;
    std::atomic<size_t> open_streams{0};

    bool AcquireStream();
    void ReleaseStream();

    void Install();
    void HandleStreamOpen(const std::string& backend, httplib::Response& res);
    void HandleStreamPost(const std::string& backend, const httplib::Request& req,
                          httplib::Response& res);
};

void HttpServer::Impl::Install() {
    const size_t threads = EffectiveThreads(options);
    server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogDebug("http", req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    server.set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown exception";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
            LogError("http", req.method + " " + req.path + " failed: " + what);
            SendError(res, Error::Make(ErrorCategory::Internal, req.path, "", what));
        });

    server.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (req.path == "/" || req.path == "/health") {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        auto admitted = gate.Admit(HeadersOf(req));
        if (admitted.IsErr()) {
            LogWarn("http", "rejected " + req.method + " " + req.path + ": " +
                                admitted.Error().message);
            SendError(res, admitted.Error());
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, gateway.Info());
    });

    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto report = gateway.SystemHealth();
        SendJson(res, report["status"] == "healthy" ? 200 : 503, report);
    });

    server.Get("/backends", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, gateway.ListBackends());
    });

    server.Post("/backends", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = ParseBody(req, "AddBackend");
        if (body.IsErr()) {
            SendError(res, body.Error());
            return;
        }
        auto added = gateway.AddBackends(body.Value());
        if (added.IsErr()) {
            SendError(res, added.Error());
            return;
        }
        SendJson(res, 201, added.Value());
    });

    server.Get(Route(""), [this](const httplib::Request& req, httplib::Response& res) {
        auto described = gateway.DescribeBackend(req.matches[1]);
        if (described.IsErr()) {
            SendError(res, described.Error());
            return;
        }
        SendJson(res, 200, described.Value());
    });

    server.Delete(Route(""), [this](const httplib::Request& req, httplib::Response& res) {
        const std::string name = req.matches[1];
        auto removed = gateway.RemoveBackend(name);
        if (removed.IsErr()) {
            SendError(res, removed.Error());
            return;
        }
        SendJson(res, 200, {{"status", "removed"}, {"name", name}});
    });

    server.Post(Route("/restart"), [this](const httplib::Request& req, httplib::Response& res) {
        auto restarted = gateway.RestartBackend(req.matches[1]);
        if (restarted.IsErr()) {
            SendError(res, restarted.Error());
            return;
        }
        SendJson(res, 200, restarted.Value());
    });

    server.Post(Route("/message"), [this](const httplib::Request& req, httplib::Response& res) {
        auto body = ParseBody(req, "SendMessage");
        if (body.IsErr()) {
            SendError(res, body.Error());
            return;
        }
        auto reply = gateway.SendMessage(req.matches[1], body.Value());
        if (reply.IsErr()) {
            SendError(res, reply.Error());
            return;
        }
        if (!reply.Value()) {
            SendJson(res, 202, {{"status", "accepted"}});
            return;
        }
        res.status = 200;
        res.set_content(protocol::Encode(*reply.Value()), kJson);
    });

    server.Post(Route("/initialize"), [this](const httplib::Request& req,
                                             httplib::Response& res) {
        auto body = ParseBody(req, "Initialize");
        if (body.IsErr()) {
            SendError(res, body.Error());
            return;
        }
        const auto& params = body.Value().contains("params") ? body.Value()["params"]
                                                             : body.Value();
        auto result = gateway.Initialize(req.matches[1], params);
        if (result.IsErr()) {
            SendError(res, result.Error());
            return;
        }
        SendJson(res, 200, result.Value());
    });

    server.Get(Route("/stream"), [this](const httplib::Request& req, httplib::Response& res) {
        HandleStreamOpen(req.matches[1], res);
    });

    server.Post(Route("/stream"), [this](const httplib::Request& req, httplib::Response& res) {
        HandleStreamPost(req.matches[1], req, res);
    });

    server.Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, gateway.ListTools());
    });

    server.Post("/call", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = ParseBody(req, "CallTool");
        if (body.IsErr()) {
            SendError(res, body.Error());
            return;
        }
        const auto& request = body.Value();
        if (!request.contains("tool") || !request["tool"].is_string()) {
            SendError(res, Error::Make(ErrorCategory::InvalidRequest, "CallTool", "",
                                       "missing 'tool'"));
            return;
        }
        const auto tool = request["tool"].get<std::string>();
        const auto arguments = request.value("arguments", nlohmann::json::object());
        auto result = gateway.CallTool(tool, arguments);
        if (result.IsErr()) {
            SendError(res, result.Error());
            return;
        }
        SendJson(res, 200, {{"tool", tool},
                            {"arguments", arguments},
                            {"result", result.Value()},
                            {"status", "success"}});
    });
}

bool HttpServer::Impl::AcquireStream() {
    size_t current = open_streams.load();
    while (current < max_streams) {
        if (open_streams.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

void HttpServer::Impl::ReleaseStream() {
    open_streams.fetch_sub(1);
}

void HttpServer::Impl::HandleStreamOpen(const std::string& backend, httplib::Response& res) {
    if (!AcquireStream()) {
        LogWarn("http", "refusing stream for " + backend + ": " + std::to_string(max_streams) +
                            " streams already open");
        SendError(res, Error::Make(ErrorCategory::Overloaded, "OpenStream", backend,
                                   "too many open streams",
                                   "limit " + std::to_string(max_streams)));
        return;
    }
    auto opened = gateway.OpenSession(backend);
    if (opened.IsErr()) {
        ReleaseStream();
        SendError(res, opened.Error());
        return;
    }
    auto session = opened.Value();
    const std::string id = session->Id();
    const std::string post_url = gateway.Options().http_base_url + "/backends/" + backend +
                                 "/stream?session_id=" + id;

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    res.set_header("Mcp-Session-Id", id);

    auto greeted = std::make_shared<bool>(false);
    auto last_write = std::make_shared<SteadyClock::time_point>(SteadyClock::now());

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, session, greeted, last_write, post_url](size_t, httplib::DataSink& sink) {
            auto write = [&sink](const std::string& s) {
                if (sink.is_writable && !sink.is_writable()) {
                    return false;
                }
                return sink.write(s.data(), s.size());
            };
            if (stopping) {
                sink.done();
                return true;
            }
            if (!*greeted) {
                *greeted = true;
                nlohmann::json hello = {{"session_id", session->Id()}, {"post_url", post_url}};
                return write(SseEvent("session", Dump(hello)));
            }

            auto message = session->Queue()->Pop(options.stream_poll);
            const auto now = SteadyClock::now();
            if (message) {
                session->Touch(now);
                *last_write = now;
                return write(SseEvent("message", protocol::Encode(*message)));
            }
            if (session->Queue()->IsClosed()) {
                sink.done();
                return true;
            }
            if (now - *last_write >= options.heartbeat) {
                *last_write = now;
                return write(": heartbeat\n\n");
            }
            return true;
        },
        [this, id](bool success) {
            LogDebug("http", "stream " + id + (success ? " finished" : " disconnected"));
            ReleaseStream();
            auto closed = gateway.CloseSession(id);
            if (closed.IsErr()) {
                LogDebug("http", closed.Error().message);
            }
        });
}

void HttpServer::Impl::HandleStreamPost(const std::string& backend, const httplib::Request& req,
                                        httplib::Response& res) {
    std::string session_id = req.get_param_value("session_id");
    if (session_id.empty() && req.has_header("Mcp-Session-Id")) {
        session_id = req.get_header_value("Mcp-Session-Id");
    }
    if (session_id.empty()) {
        SendError(res, Error::Make(ErrorCategory::InvalidRequest, "PostSessionMessage", backend,
                                   "missing session_id"));
        return;
    }
    auto body = ParseBody(req, "PostSessionMessage");
    if (body.IsErr()) {
        SendError(res, body.Error());
        return;
    }
    auto posted = gateway.PostSessionMessage(backend, session_id, body.Value());
    if (posted.IsErr()) {
        SendError(res, posted.Error());
        return;
    }
    SendJson(res, 202, {{"status", "accepted"}, {"session_id", session_id}});
}

// ---------------------------------------------------------------------------
// HttpServer
// ---------------------------------------------------------------------------
HttpServer::HttpServer(GatewayFacade& gateway, const IRequestGate& gate,
                       HttpServerOptions options)
    : impl_(std::make_unique<Impl>(gateway, gate, std::move(options))) {
    impl_->Install();
}

HttpServer::~HttpServer() {
    Stop();
}

Result<void, Error> HttpServer::Start() {
    auto& impl = *impl_;
    if (impl.thread.joinable()) {
        return Result<void, Error>::Ok();
    }
    if (impl.options.port == 0) {
        impl.bound_port = impl.server.bind_to_any_port(impl.options.host);
    } else if (impl.server.bind_to_port(impl.options.host, impl.options.port)) {
        impl.bound_port = impl.options.port;
    } else {
        impl.bound_port = -1;
    }
    if (impl.bound_port <= 0) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "StartHttpServer", "",
            "cannot bind " + impl.options.host + ":" + std::to_string(impl.options.port)));
    }
    impl.stopping = false;
    impl.thread = std::thread([&impl] {
        if (!impl.server.listen_after_bind()) {
            LogError("http", "server loop exited with an error");
        }
    });
    LogInfo("http", "listening on " + impl.options.host + ":" + std::to_string(impl.bound_port));
    return Result<void, Error>::Ok();
}

void HttpServer::Stop() {
    auto& impl = *impl_;
    impl.stopping = true;
    impl.server.stop();
    if (impl.thread.joinable()) {
        impl.thread.join();
        LogInfo("http", "stopped");
    }
}

int HttpServer::BoundPort() const {
    return impl_->bound_port;
}

size_t HttpServer::OpenStreams() const {
    return impl_->open_streams.load();
}

size_t HttpServer::MaxStreams() const {
    return impl_->max_streams;
}

} // namespace mcp_fleet
