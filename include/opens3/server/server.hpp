#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "opens3/config.hpp"
#include "opens3/server/errors.hpp"
#include "opens3/storage/object_store.hpp"

// 前向声明
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace opens3 {
namespace server {

using json = nlohmann::json;

// 请求和响应结构
struct Request {
    // multipart 表单中的一个部分, 普通字段的 filename 为空
    struct File {
        std::string field_name;
        std::string filename;
        std::string content_type;
        std::string content;
    };

    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::map<std::string, std::string> params; // 路径参数
    std::map<std::string, std::string> query;  // 查询参数
    std::vector<File> files;
    std::string remoteAddr;

    // 头部名不区分大小写, 不存在时返回空串
    std::string Header(const std::string& name) const;
    // 查询参数, 不存在时返回 nullptr
    const std::string* Query(const std::string& name) const;
    // 按字段名查找表单部分, 不存在时返回 nullptr
    const File* FormPart(const std::string& fieldName) const;
};

// 分块输出响应体: 从 offset 起写出 length 字节
using ContentProvider = std::function<bool(uint64_t offset, uint64_t length,
                                           const storage::ChunkSink& sink)>;

struct Response {
    int status = 200;
    std::map<std::string, std::string> headers;
    std::string body;
    // 设置后忽略 body, 按 contentLength 流式输出
    ContentProvider contentProvider;
    uint64_t contentLength = 0;
};

// 上下文
struct Context {
    Request request;
    storage::ObjectStore* store = nullptr;
    const Credentials* credentials = nullptr; // 为空时不做认证
};

// 处理器函数类型
using Handler = std::function<Error(const Context&, Response&)>;

// 路由器
class Router {
public:
    // authenticated 为 true 时请求必须带有效的 Basic 凭据
    void AddRoute(const std::string& method, const std::string& path, Handler handler,
                  bool authenticated = true);
    Error HandleRequest(const Context& ctx, Response& response) const;

private:
    struct Route {
        std::string method;
        std::string path;
        Handler handler;
        bool authenticated;
    };
    std::vector<Route> routes_;

    // 匹配路由并提取参数
    static bool matchRoute(const std::string& path, const std::string& routePath,
                           std::map<std::string, std::string>& params);
};

// 注册全部 HTTP 路由
void RegisterRoutes(Router& router);

// 把错误写成 {"detail": ...} 响应
void WriteError(const Error& err, Response& response);

// 服务器配置
struct ServerConfig {
    std::string addr = "0.0.0.0:8001";
    Credentials credentials;
    storage::ObjectStore* store = nullptr;
};

// 服务器
class Server {
public:
    explicit Server(const ServerConfig& config);
    ~Server();

    Error Run();
    void Stop();

private:
    void setupRoutes();
    void handleHttpRequest(const httplib::Request& req, httplib::Response& res);

    ServerConfig config_;
    Router router_;
    std::unique_ptr<httplib::Server> http_;
};

// 处理函数声明
namespace handlers {
    Error MainHandler(const Context& ctx, Response& resp);
    Error PreflightHandler(const Context& ctx, Response& resp);
    Error NotFoundHandler(const Context& ctx, Response& resp);

    Error CreateBucketHandler(const Context& ctx, Response& resp);
    Error ListBucketsHandler(const Context& ctx, Response& resp);
    Error HeadBucketHandler(const Context& ctx, Response& resp);
    Error DeleteBucketHandler(const Context& ctx, Response& resp);
    Error CreateDirectoryHandler(const Context& ctx, Response& resp);

    Error UploadObjectHandler(const Context& ctx, Response& resp);
    Error ListObjectsHandler(const Context& ctx, Response& resp);
    Error HeadObjectHandler(const Context& ctx, Response& resp);
    Error GetObjectMetadataHandler(const Context& ctx, Response& resp);
    Error GetObjectHandler(const Context& ctx, Response& resp);
    Error DeleteObjectHandler(const Context& ctx, Response& resp);
}

} // namespace server
} // namespace opens3
