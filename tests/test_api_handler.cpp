#undef NDEBUG
#include "api_handler.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

#include <assert.h>
#include <stdexcept>

namespace {

// Wires a handler the way DispatchCenter does, minus the network.
struct Fixture {
    explicit Fixture(const std::map<std::string, std::string>& values)
        : config(Config::fromValues(values)),
          notifier(sink, 1) {
        if (config.paymentEnabled) {
            const PaymentSettings& p = config.payment;
            verifier = std::make_unique<PaymentVerifier>(
                makeSignatureScheme(p.signScheme, p.secret, p.signatureField, p.unsignedFields), p, store);
        }
        router = std::make_unique<IngressRouter>(config, store, verifier.get(), notifier);
        queue = std::make_unique<WorkerQueue>(store, notifier);
        api = std::make_unique<ApiHandler>(config, *router, *queue, store);
    }

    ApiResponse get(const std::string& target) {
        return api->handle({"GET", target, "", ""});
    }

    ApiResponse post(const std::string& target, const std::string& contentType, const std::string& body) {
        return api->handle({"POST", target, contentType, body});
    }

    Config config;
    JobStore store;
    RecordingSink sink;
    NotificationDispatcher notifier;
    std::unique_ptr<PaymentVerifier> verifier;
    std::unique_ptr<IngressRouter> router;
    std::unique_ptr<WorkerQueue> queue;
    std::unique_ptr<ApiHandler> api;
};

// A scheme whose backend has gone away.
class BrokenScheme : public SignatureScheme {
public:
    BrokenScheme() : SignatureScheme(DigestAlgorithm::Md5, "s3cr3t", {"sign"}) {}

    std::string name() const override { return "broken"; }

    std::string canonicalize(const NotificationFields&) const override {
        throw std::runtime_error("digest backend unavailable");
    }
};

std::string signedPayment(const Config& config, const std::string& jobId, const std::string& money) {
    const PaymentSettings& p = config.payment;
    NotificationFields fields = {
        {"pid", p.partnerId},
        {"trade_no", "2024000001"},
        {"out_trade_no", jobId},
        {"money", money},
        {"trade_status", "TRADE_SUCCESS"},
        {"sign_type", "MD5"},
    };
    fields["sign"] = makeSignatureScheme(p.signScheme, p.secret, p.signatureField, p.unsignedFields)->sign(fields);
    return Utils::buildQueryString(fields);
}

}

int main() {
    /* Health reports service name and job counts.  */
    {
        Fixture f(baseConfigValues());
        auto response = f.get("/");
        assert(response.status == 200);
        assert(response.body["status"] == "ok");
        assert(response.body["service"] == "Telebot Dispatch Center");
        assert(response.body["jobs"].is_object());

        f.store.create("p", "1", std::nullopt, JobStatus::Pending);
        response = f.get("/");
        assert(response.body["jobs"]["PENDING"] == 1);
    }

    /* Unknown routes and methods.  */
    {
        Fixture f(baseConfigValues());
        assert(f.get("/nope").status == 404);
        assert(f.post("/api/get-task", "", "").status == 404);
        assert(f.get("/api/update-task").status == 404);
        assert(f.get("/123456:test-token").status == 404);
    }

    /* The webhook lives under the secret path and always answers 200.  */
    {
        Fixture f(baseConfigValues());
        Json update = {
            {"update_id", 7},
            {"message", {{"chat", {{"id", 42}}}, {"text", "/vtuber a fox girl"}}}
        };
        auto response = f.post("/123456:test-token", "application/json", update.dump());
        assert(response.status == 200);
        assert(f.store.size() == 1);

        assert(f.post("/123456:test-token", "application/json", "{not json").status == 200);
        assert(f.post("/123456:test-token", "application/json", "{\"edited_message\":{}}").status == 200);
        assert(f.store.size() == 1);
        assert(f.post("/wrong-secret", "application/json", update.dump()).status == 404);
    }

    /* Worker API: idle sentinel, claim, report.  */
    {
        Fixture f(baseConfigValues());
        auto idle = f.get("/api/get-task");
        assert(idle.status == 200);
        assert(idle.body["job_id"].is_null());
        assert(idle.body["prompt"].is_null());
        assert(idle.body["chat_id"].is_null());

        auto id = f.store.create("a fox girl", "42", std::nullopt, JobStatus::Pending);
        auto task = f.get("/api/get-task");
        assert(task.body["job_id"] == id);
        assert(task.body["prompt"] == "a fox girl");
        assert(task.body["chat_id"] == "42");
        assert(f.get("/api/get-task").body["job_id"].is_null());

        Json report = {{"job_id", id}, {"status", "COMPLETED"}, {"result_url", "https://tunnel.example/x.zip"}};
        auto done = f.post("/api/update-task", "application/json", report.dump());
        assert(done.status == 200);
        assert(contains(done.body["message"].get<std::string>(), id));
        assert(f.store.get(id)->status == JobStatus::Completed);

        // A second terminal report conflicts
        report["status"] = "FAILED";
        assert(f.post("/api/update-task", "application/json", report.dump()).status == 409);
        assert(f.store.get(id)->status == JobStatus::Completed);

        f.notifier.drain();
        assert(f.sink.sent().size() == 1);
    }

    /* update-task input errors.  */
    {
        Fixture f(baseConfigValues());
        auto id = f.store.create("p", "1", std::nullopt, JobStatus::Pending);
        f.get("/api/get-task");

        assert(f.post("/api/update-task", "application/json", "garbage").status == 400);
        assert(f.post("/api/update-task", "application/json", "[]").status == 400);
        assert(f.post("/api/update-task", "application/json", Json({{"job_id", id}}).dump()).status == 400);
        assert(f.post("/api/update-task", "application/json",
                      Json({{"job_id", id}, {"status", "PENDING"}}).dump()).status == 400);
        assert(f.store.get(id)->status == JobStatus::Running);

        auto missing = f.post("/api/update-task", "application/json",
                              Json({{"job_id", "no-such-job"}, {"status", "COMPLETED"}}).dump());
        assert(missing.status == 404);
        assert(missing.body["detail"] == "Job not found");
        assert(f.store.size() == 1);
    }

    /* Payment notification through query, form and JSON bodies.  */
    {
        auto values = paymentConfigValues();
        Fixture f(values);

        auto viaQuery = f.store.create("q", "1", std::nullopt, JobStatus::AwaitingPayment);
        auto viaForm = f.store.create("f", "2", std::nullopt, JobStatus::AwaitingPayment);
        auto viaJson = f.store.create("j", "3", std::nullopt, JobStatus::AwaitingPayment);

        auto r1 = f.get("/api/payment-notify?" + signedPayment(f.config, viaQuery, "9.90"));
        assert(r1.status == 200);
        assert(r1.body["result"] == "success");
        assert(f.store.get(viaQuery)->status == JobStatus::Pending);

        auto r2 = f.post("/api/payment-notify", "application/x-www-form-urlencoded",
                         signedPayment(f.config, viaForm, "9.90"));
        assert(r2.status == 200);
        assert(f.store.get(viaForm)->status == JobStatus::Pending);

        Json json = Json::object();
        for (const auto& [key, value] : Utils::parseQueryString(signedPayment(f.config, viaJson, "9.9"))) {
            json[key] = value;
        }
        auto r3 = f.post("/api/payment-notify", "application/json; charset=utf-8", json.dump());
        assert(r3.status == 200);
        assert(f.store.get(viaJson)->status == JobStatus::Pending);

        // Duplicate: acknowledged, nothing changes
        assert(f.get("/api/payment-notify?" + signedPayment(f.config, viaQuery, "9.90")).status == 200);

        f.notifier.drain();
        assert(f.sink.sent().size() == 3);
    }

    /* Bad payment notifications.  */
    {
        Fixture f(paymentConfigValues());
        auto id = f.store.create("q", "1", std::nullopt, JobStatus::AwaitingPayment);

        std::string query = signedPayment(f.config, id, "9.90");
        auto forged = f.get("/api/payment-notify?" + query + "X");
        assert(forged.status == 400);
        assert(forged.body["result"] == "fail");

        // Missing signature field
        assert(f.get("/api/payment-notify?out_trade_no=" + id + "&money=9.90").status == 400);
        assert(f.post("/api/payment-notify", "application/json", "{broken").status == 400);
        assert(f.post("/api/payment-notify", "application/json", "[1,2]").status == 400);

        // Underpaid: acknowledged, job stays gated
        auto cheap = f.get("/api/payment-notify?" + signedPayment(f.config, id, "0.99"));
        assert(cheap.status == 200);
        assert(f.store.get(id)->status == JobStatus::AwaitingPayment);

        f.notifier.drain();
        assert(f.sink.sent().empty());
    }

    /* Custom webhook secret.  */
    {
        auto values = baseConfigValues();
        values["WEBHOOK_SECRET"] = "hook-42";
        Fixture f(values);
        assert(f.post("/hook-42", "application/json", "{}").status == 200);
        assert(f.post("/123456:test-token", "application/json", "{}").status == 404);
    }

    /* Unexpected failures answer 500 with a generic body.  */
    {
        Config config = Config::fromValues(paymentConfigValues());
        JobStore store;
        RecordingSink sink;
        NotificationDispatcher notifier(sink, 1);
        PaymentVerifier verifier(std::make_unique<BrokenScheme>(), config.payment, store);
        IngressRouter router(config, store, &verifier, notifier);
        WorkerQueue queue(store, notifier);
        ApiHandler api(config, router, queue, store);

        auto id = store.create("q", "1", std::nullopt, JobStatus::AwaitingPayment);
        auto response = api.handle({"GET", "/api/payment-notify?pid=1001&out_trade_no=" + id
                                               + "&money=9.90&trade_status=TRADE_SUCCESS&sign=abc", "", ""});
        assert(response.status == 500);
        assert(response.body["detail"] == "Internal server error");
        assert(!contains(response.body.dump(), "digest backend"));
        assert(store.get(id)->status == JobStatus::AwaitingPayment);

        // The server keeps answering afterwards
        assert(api.handle({"GET", "/", "", ""}).status == 200);
    }

    return 0;
}
