#include "api_handler.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

ApiHandler::ApiHandler(const Config& config, IngressRouter& router, WorkerQueue& queue, const JobStore& store)
    : config_(config),
      router_(router),
      queue_(queue),
      store_(store),
      webhookPath_("/" + config.webhookSecret) {}

ApiResponse ApiHandler::handle(const ApiRequest& request) {
    std::string path = request.target;
    std::string query;
    auto q = path.find('?');
    if (q != std::string::npos) {
        query = path.substr(q + 1);
        path.resize(q);
    }

    try {
        if (path == "/" && request.method == "GET") {
            return health();
        }
        if (path == webhookPath_ && request.method == "POST") {
            return chatWebhook(request);
        }
        if (path == "/api/payment-notify" && (request.method == "POST" || request.method == "GET")) {
            return paymentNotify(request, query);
        }
        if (path == "/api/get-task" && request.method == "GET") {
            return getTask();
        }
        if (path == "/api/update-task" && request.method == "POST") {
            return updateTask(request);
        }
    } catch (const std::exception& e) {
        Logger::formattedError("{} {} failed: {}", request.method, path, e.what());
        return {500, {{"detail", "Internal server error"}}};
    }

    // The webhook secret must not show up in logs
    Logger::formattedDebug("No route for {} {}", request.method, path == webhookPath_ ? "/<webhook>" : path);
    return {404, {{"detail", "Not Found"}}};
}

ApiResponse ApiHandler::health() const {
    Json jobs = Json::object();
    for (const auto& [status, count] : store_.countByStatus()) {
        jobs[toString(status)] = count;
    }
    return {200, {{"status", "ok"}, {"service", config_.serviceName}, {"jobs", jobs}}};
}

ApiResponse ApiHandler::chatWebhook(const ApiRequest& request) {
    // The platform retries anything but 200, so errors stay here
    try {
        router_.handleChatUpdate(Json::parse(request.body));
    } catch (const Json::exception& e) {
        Logger::formattedWarn("Unreadable chat update: {}", e.what());
    } catch (const std::exception& e) {
        Logger::formattedError("Chat update handling failed: {}", e.what());
    }
    return {200, Json::object()};
}

ApiResponse ApiHandler::paymentNotify(const ApiRequest& request, const std::string& query) {
    NotificationFields fields;
    try {
        fields = collectFields(request, query);
        if (router_.handlePaymentNotify(fields) == PaymentNotifyResult::AuthenticationFailed) {
            throw AuthenticationError("Signature verification failed");
        }
    } catch (const AuthenticationError& e) {
        return {400, {{"result", "fail"}, {"detail", e.what()}}};
    } catch (const ValidationError& e) {
        Logger::formattedWarn("Malformed payment notification: {}", e.what());
        return {400, {{"result", "fail"}, {"detail", e.what()}}};
    }
    return {200, {{"result", "success"}}};
}

ApiResponse ApiHandler::getTask() {
    auto task = queue_.getTask();
    if (!task) {
        return {200, {{"job_id", nullptr}, {"prompt", nullptr}, {"chat_id", nullptr}}};
    }
    return {200, {{"job_id", task->jobId}, {"prompt", task->prompt}, {"chat_id", task->originator}}};
}

ApiResponse ApiHandler::updateTask(const ApiRequest& request) {
    try {
        Json body = Json::parse(request.body);
        if (!body.is_object() || !body.contains("job_id") || !body["job_id"].is_string()
            || !body.contains("status") || !body["status"].is_string()) {
            throw ValidationError("job_id and status are required strings");
        }

        std::optional<std::string> resultUrl;
        if (body.contains("result_url") && body["result_url"].is_string()) {
            resultUrl = body["result_url"].get<std::string>();
        }

        Job job = queue_.reportResult(body["job_id"].get<std::string>(), body["status"].get<std::string>(), resultUrl);
        return {200, {{"message", "Task " + job.id + " updated to " + toString(job.status)}}};
    } catch (const Json::exception& e) {
        return {400, {{"detail", std::string("Invalid JSON body: ") + e.what()}}};
    } catch (const ValidationError& e) {
        return {400, {{"detail", e.what()}}};
    } catch (const NotFoundError&) {
        return {404, {{"detail", "Job not found"}}};
    } catch (const InvalidTransitionError& e) {
        return {409, {{"detail", e.what()}}};
    }
}

NotificationFields ApiHandler::collectFields(const ApiRequest& request, const std::string& query) {
    NotificationFields fields = Utils::parseQueryString(query);
    if (Utils::trim(request.body).empty()) return fields;

    if (Utils::toLower(request.contentType).find("json") != std::string::npos) {
        Json body;
        try {
            body = Json::parse(request.body);
        } catch (const Json::exception& e) {
            throw ValidationError(std::string("Invalid JSON notification: ") + e.what());
        }
        if (!body.is_object()) throw ValidationError("Notification body must be an object");
        for (const auto& [key, value] : body.items()) {
            if (value.is_null()) continue;
            fields[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    } else {
        for (auto& [key, value] : Utils::parseQueryString(request.body)) {
            fields[key] = value;
        }
    }
    return fields;
}
