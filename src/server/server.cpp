#include "opens3/server/server.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "opens3/server/auth.hpp"
#include "opens3/utils/logger.hpp"

namespace opens3 {
namespace server {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::string Request::Header(const std::string& name) const {
    for (const auto& header : headers) {
        if (iequals(header.first, name)) {
            return header.second;
        }
    }
    return "";
}

const std::string* Request::Query(const std::string& name) const {
    auto it = query.find(name);
    return it == query.end() ? nullptr : &it->second;
}

const Request::File* Request::FormPart(const std::string& fieldName) const {
    for (const auto& file : files) {
        if (file.field_name == fieldName) {
            return &file;
        }
    }
    return nullptr;
}

void Router::AddRoute(const std::string& method, const std::string& path, Handler handler,
                      bool authenticated) {
    routes_.push_back({method, path, std::move(handler), authenticated});
}

bool Router::matchRoute(const std::string& path, const std::string& routePath,
                        std::map<std::string, std::string>& params) {
    // 把 {name:regex} 替换为捕获组
    static const std::regex paramRegex("\\{([a-zA-Z0-9]+):(.*?)\\}");
    std::string regexPattern;

    std::smatch matches;
    std::string::const_iterator searchStart(routePath.cbegin());

    std::vector<std::string> paramNames;

    while (std::regex_search(searchStart, routePath.cend(), matches, paramRegex)) {
        regexPattern += std::string(searchStart, searchStart + matches.position());
        regexPattern += "(" + std::string(matches[2]) + ")";

        paramNames.push_back(matches[1]);

        searchStart += matches.position() + matches.length();
    }

    regexPattern += std::string(searchStart, routePath.cend());
    regexPattern = "^" + regexPattern + "$";

    std::regex fullRegex(regexPattern);
    std::smatch pathMatches;

    if (std::regex_match(path, pathMatches, fullRegex)) {
        // pathMatches[0]是整个匹配，从1开始是捕获组
        for (size_t i = 0; i < paramNames.size(); ++i) {
            params[paramNames[i]] = pathMatches[i + 1].str();
        }
        return true;
    }

    return false;
}

Error Router::HandleRequest(const Context& ctx, Response& response) const {
    for (const auto& route : routes_) {
        if (route.method != ctx.request.method) {
            continue;
        }
        std::map<std::string, std::string> params;
        if (!matchRoute(ctx.request.path, route.path, params)) {
            continue;
        }

        utils::GetLogger().Debug("匹配到路由",
            utils::LogContext()
                .With("method", route.method)
                .With("path", route.path)
                .With("requestPath", ctx.request.path));

        if (route.authenticated && ctx.credentials) {
            Error authErr = Authenticate(ctx.request.Header("Authorization"), *ctx.credentials);
            if (!authErr.ok()) {
                response.headers["WWW-Authenticate"] = "Basic";
                return authErr;
            }
        }

        Context newCtx = ctx;
        newCtx.request.params = params;
        return route.handler(newCtx, response);
    }

    return handlers::NotFoundHandler(ctx, response);
}

void RegisterRoutes(Router& router) {
    router.AddRoute("GET", "/", handlers::MainHandler, false);
    router.AddRoute("OPTIONS", "{path:.*}", handlers::PreflightHandler, false);

    // 存储桶
    router.AddRoute("POST", "/buckets", handlers::CreateBucketHandler);
    router.AddRoute("GET", "/buckets", handlers::ListBucketsHandler);
    router.AddRoute("HEAD", "/buckets/{bucket:[^/]+}", handlers::HeadBucketHandler);
    router.AddRoute("DELETE", "/buckets/{bucket:[^/]+}", handlers::DeleteBucketHandler);
    router.AddRoute("POST", "/buckets/{bucket:[^/]+}/directories", handlers::CreateDirectoryHandler);

    // 对象, key 可以跨越 '/'; /metadata 必须先于普通对象路由匹配
    router.AddRoute("POST", "/buckets/{bucket:[^/]+}/objects", handlers::UploadObjectHandler);
    router.AddRoute("GET", "/buckets/{bucket:[^/]+}/objects", handlers::ListObjectsHandler);
    router.AddRoute("DELETE", "/buckets/{bucket:[^/]+}/objects", handlers::DeleteObjectHandler);
    router.AddRoute("GET", "/buckets/{bucket:[^/]+}/object", handlers::GetObjectHandler);
    router.AddRoute("GET", "/buckets/{bucket:[^/]+}/objects/{key:.+}/metadata",
                    handlers::GetObjectMetadataHandler);
    router.AddRoute("HEAD", "/buckets/{bucket:[^/]+}/objects/{key:.+}", handlers::HeadObjectHandler);
    router.AddRoute("GET", "/buckets/{bucket:[^/]+}/objects/{key:.+}", handlers::GetObjectHandler);
    router.AddRoute("DELETE", "/buckets/{bucket:[^/]+}/objects/{key:.+}", handlers::DeleteObjectHandler);
}

void WriteError(const Error& err, Response& response) {
    response.status = err.HTTPStatusCode();
    response.body = json{{"detail", err.Detail()}}.dump();
    response.headers["Content-Type"] = "application/json";
    response.contentProvider = nullptr;
}

Server::Server(const ServerConfig& config) : config_(config) {
    setupRoutes();
}

Server::~Server() = default;

void Server::setupRoutes() {
    RegisterRoutes(router_);
    utils::GetLogger().Debug("路由设置完成");
}

void Server::Stop() {
    if (http_) {
        http_->stop();
    }
}

Error Server::Run() {
    if (!config_.store) {
        return Error::ErrNoStorage;
    }

    auto address = ParseAddress(config_.addr);
    if (!address.ok()) {
        return Error::ErrInvalidArgument.WithDetail(address.error().what());
    }
    const std::string& host = address.value().first;
    int port = address.value().second;

    http_ = std::make_unique<httplib::Server>();

    http_->set_default_headers({
        {"Server", "OpenS3/1.0"},
        {"Access-Control-Allow-Origin", "*"},
    });

    http_->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                    std::exception_ptr ep) {
        std::string message;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "Unknown error";
        }
        utils::GetLogger().Error("服务器异常",
            utils::LogContext()
                .With("exception", message)
                .With("path", req.path)
                .With("method", req.method));

        res.status = 500;
        res.set_content(json{{"detail", message}}.dump(), "application/json");
    });

    http_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utils::LogContext ctx;
        ctx.WithField("method", req.method);
        ctx.WithField("path", req.path);
        ctx.WithField("status", std::to_string(res.status));
        ctx.WithField("remoteAddr", req.remote_addr);

        // 根据状态码选择日志级别
        if (res.status >= 500) {
            utils::GetLogger().Error("HTTP请求完成", ctx);
        } else if (res.status >= 400) {
            utils::GetLogger().Warn("HTTP请求完成", ctx);
        } else {
            utils::GetLogger().Info("HTTP请求完成", ctx);
        }
    });

    // HEAD 请求由 cpp-httplib 分派到 GET 处理器, 方法名从 req.method 取
    auto dispatch = [this](const httplib::Request& req, httplib::Response& res) {
        handleHttpRequest(req, res);
    };
    http_->Get(".*", dispatch);
    http_->Post(".*", dispatch);
    http_->Delete(".*", dispatch);
    http_->Options(".*", dispatch);

    utils::GetLogger().Info("服务器开始监听",
        utils::LogContext()
            .With("host", host)
            .With("port", std::to_string(port))
            .With("storageRoot", config_.store->Resolver().Root().string()));

    if (!http_->listen(host.c_str(), port)) {
        utils::GetLogger().Fatal("无法启动服务器",
            utils::LogContext()
                .With("host", host)
                .With("port", std::to_string(port)));
        return Error::ErrInternal.WithDetail("无法监听 " + config_.addr);
    }

    return Error();
}

void Server::handleHttpRequest(const httplib::Request& req, httplib::Response& res) {
    utils::GetLogger().Debug("开始处理HTTP请求",
        utils::LogContext()
            .With("method", req.method)
            .With("path", req.path)
            .With("remoteAddr", req.remote_addr));

    Request request;
    request.method = req.method;
    request.path = req.path;
    request.body = req.body;
    request.remoteAddr = req.remote_addr;

    for (const auto& header : req.headers) {
        request.headers.emplace(header.first, header.second);
    }
    for (const auto& param : req.params) {
        request.query.emplace(param.first, param.second);
    }
    for (const auto& part : req.files) {
        Request::File file;
        file.field_name = part.first;
        file.filename = part.second.filename;
        file.content_type = part.second.content_type;
        file.content = part.second.content;
        request.files.push_back(std::move(file));
    }

    Context ctx;
    ctx.request = std::move(request);
    ctx.store = config_.store;
    ctx.credentials = &config_.credentials;

    Response response;
    Error err = router_.HandleRequest(ctx, response);

    if (!err.ok()) {
        WriteError(err, response);
        utils::GetLogger().Warn("请求处理出错",
            utils::LogContext()
                .With("code", std::to_string(err.Code()))
                .With("message", err.Detail())
                .With("statusCode", std::to_string(response.status))
                .With("method", req.method)
                .With("path", req.path));
    }

    std::string contentType = "application/json";
    for (const auto& header : response.headers) {
        if (iequals(header.first, "Content-Type")) {
            contentType = header.second;
            continue;
        }
        res.set_header(header.first, header.second);
    }

    res.status = response.status;
    if (response.contentProvider) {
        auto provider = response.contentProvider;
        res.set_content_provider(
            static_cast<size_t>(response.contentLength), contentType,
            [provider](size_t offset, size_t length, httplib::DataSink& sink) {
                return provider(offset, length, [&sink](const char* data, size_t size) {
                    return sink.write(data, size);
                });
            });
    } else if (response.status != 204) {
        res.set_content(response.body, contentType);
    }
}

} // namespace server
} // namespace opens3
