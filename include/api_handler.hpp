#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "ingress_router.hpp"
#include "job_store.hpp"
#include "worker_queue.hpp"

using Json = nlohmann::json;

struct ApiRequest {
    std::string method;        // "GET", "POST", ...
    std::string target;        // path plus optional query string
    std::string contentType;
    std::string body;
};

struct ApiResponse {
    unsigned status;
    Json body;
};

/**
 * @class ApiHandler
 * @brief Maps HTTP requests onto the router and the worker queue.
 *
 * Transport independent: HttpSession feeds it parsed requests and writes the
 * returned status and JSON body back. This is the single place where the
 * error taxonomy is turned into status codes.
 */
class ApiHandler {
public:
    ApiHandler(const Config& config, IngressRouter& router, WorkerQueue& queue, const JobStore& store);

    ApiResponse handle(const ApiRequest& request);

private:
    ApiResponse health() const;
    ApiResponse chatWebhook(const ApiRequest& request);
    ApiResponse paymentNotify(const ApiRequest& request, const std::string& query);
    ApiResponse getTask();
    ApiResponse updateTask(const ApiRequest& request);

    static NotificationFields collectFields(const ApiRequest& request, const std::string& query);

    const Config& config_;
    IngressRouter& router_;
    WorkerQueue& queue_;
    const JobStore& store_;
    std::string webhookPath_;
};
