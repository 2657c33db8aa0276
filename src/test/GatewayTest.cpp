#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <map>
#include <optional>
#include <thread>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"
#include "infrastructure/BackendExecutor.hpp"
#include "infrastructure/FileStoreClient.hpp"
#include "infrastructure/InferenceClient.hpp"
#include "infrastructure/LiveCatalogClient.hpp"
#include "infrastructure/RecognitionClient.hpp"
#include "infrastructure/RemoteServiceClient.hpp"

using namespace coversync;
using namespace coversync::infrastructure;
using domain::GatewayError;
using json = nlohmann::json;

namespace {

/** Local stand-in for every backend, on an ephemeral port. */
class StubBackend {
public:
    StubBackend() {
        m_server.Post("/api/v1/image-matcher", [this](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_file("image") || !req.has_file("session_id")) {
                res.status = 400;
                return;
            }
            const auto image = req.get_file_value("image");
            m_lastImage = image.content;
            json body = {
                {"total_matches", 2},
                {"top_matches", json::array({
                    {{"comic_name", "Saga"}, {"similarity", 0.42}, {"comic_vine_id", 1}, {"year", 2012},
                     {"issue_count", 66}},
                    {{"comic_name", "Amazing Spider-Man"}, {"similarity", 0.87}, {"comic_vine_id", 99},
                     {"parent_comic_vine_id", "2127"}, {"year", "1963"}, {"issue_count", 441}}
                })},
                {"echo", {{"filename", image.filename}, {"bytes", image.content.size()},
                          {"hint", req.has_file("series_name") ? req.get_file_value("series_name").content : ""}}}
            };
            res.set_content(body.dump(), "application/json");
        });
        m_server.Get("/api/v1/secure", [](const httplib::Request& req, httplib::Response& res) {
            // base64("user:pass")
            if (req.get_header_value("Authorization") != "Basic dXNlcjpwYXNz") {
                res.status = 401;
                return;
            }
            res.set_content("ok", "text/plain");
        });
        m_server.Get("/api/v1/big", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(std::string(4096, 'b'), "application/octet-stream");
        });
        m_server.Get("/api/v1/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2500));
            res.set_content("late", "text/plain");
        });
        m_server.Get("/api/v1/teapot", [](const httplib::Request&, httplib::Response& res) {
            res.status = 418;
            res.set_content("short and stout", "text/plain");
        });
        m_server.Get("/cv/search/", [](const httplib::Request& req, httplib::Response& res) {
            if (req.get_param_value("api_key") != "cv-key") {
                res.set_content(json{{"status_code", 100}, {"error", "Invalid API Key"}}.dump(), "application/json");
                return;
            }
            if (req.get_param_value("query") == "Hellboy") {
                json odd = json::array({
                    {{"id", 1.5}, {"name", "Hellboy"}, {"start_year", "1994"}},
                    {{"id", nullptr}, {"name", "Hellboy"}, {"start_year", "1994"}},
                    {{"id", 77}, {"name", "Hellboy"}, {"start_year", 1994}, {"resource_type", 5}},
                    {{"id", 78}, {"name", "Hellboy"}, {"start_year", "1994"}, {"publisher", {{"name", 3}}}},
                    "not a volume"
                });
                res.set_content(json{{"status_code", "OK"}, {"results", odd}}.dump(), "application/json");
                return;
            }
            if (req.get_param_value("query") == "Array") {
                res.set_content("[1, 2, 3]", "application/json");
                return;
            }
            json results = json::array({
                {{"id", 4567}, {"name", "saga"}, {"start_year", "2012"}, {"count_of_issues", 66},
                 {"publisher", {{"name", "Image"}}}, {"resource_type", "volume"}},
                {{"id", 1111}, {"name", "Saga"}, {"start_year", "1985"}, {"resource_type", "volume"}},
                {{"id", 2222}, {"name", "Saga of the Swamp Thing"}, {"start_year", "2012"}, {"resource_type", "volume"}}
            });
            res.set_content(json{{"status_code", 1}, {"results", results},
                                 {"query", req.get_param_value("query")}}.dump(), "application/json");
        });
        m_server.Post("/openai/v1/chat/completions", [](const httplib::Request& req, httplib::Response& res) {
            if (req.get_header_value("Authorization") != "Bearer groq-token") {
                res.status = 401;
                return;
            }
            auto body = json::parse(req.body);
            const std::string answer = "A story about " + body["model"].get<std::string>();
            res.set_content(json{{"choices", json::array({{{"message", {{"content", answer}}}}})}}.dump(),
                            "application/json");
        });
        m_server.Put(R"(/dav/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.get_header_value("Authorization") != "Basic dXNlcjpwYXNz") {
                res.status = 401;
                return;
            }
            m_stored[req.matches[1].str()] = req.body;
            res.status = 201;
        });
        m_server.Get(R"(/dav/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            auto it = m_stored.find(req.matches[1].str());
            if (it == m_stored.end()) {
                res.status = 404;
                return;
            }
            res.set_content(it->second, "application/octet-stream");
        });

        m_port = m_server.bind_to_any_port("127.0.0.1");
        assert(m_port > 0);
        m_thread = std::thread([this] { m_server.listen_after_bind(); });
        m_server.wait_until_ready();
    }

    ~StubBackend() {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    std::string url(const std::string& prefix) const {
        return "http://127.0.0.1:" + std::to_string(m_port) + prefix;
    }

    const std::string& lastImage() const { return m_lastImage; }

private:
    httplib::Server m_server;
    std::thread m_thread;
    std::map<std::string, std::string> m_stored;
    std::string m_lastImage;
    int m_port = 0;
};

ServiceEndpoint Endpoint(const std::string& name, const std::string& url) {
    ServiceEndpoint e;
    e.name = name;
    e.baseUrl = url;
    e.connectTimeoutSeconds = 1;
    e.readTimeoutSeconds = 1;
    e.maxBufferBytes = 1024;
    e.concurrency = 2;
    return e;
}

template <typename Fn>
std::optional<GatewayError::Kind> GatewayKind(Fn fn) {
    try {
        fn();
    } catch (const GatewayError& e) {
        return e.kind();
    }
    return std::nullopt;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Gateway Test..." << std::endl;
    StubBackend backend;

    assert(RemoteServiceClient::EncodeComponent("Spider-Man & Friends") == "Spider-Man%20%26%20Friends");
    assert(FileStoreClient::EncodePath("covers/my cover.jpg") == "/covers/my%20cover.jpg");

    // Error mapping.
    {
        auto basic = Endpoint("secure", backend.url("/api/v1"));
        basic.auth = AuthScheme::Basic;
        basic.username = "user";
        basic.secret = "pass";
        RemoteServiceClient good(basic);
        assert(good.get("/secure").body == "ok");

        basic.secret = "wrong";
        RemoteServiceClient bad(basic);
        assert(GatewayKind([&] { bad.get("/secure"); }) == GatewayError::Kind::Unauthorized);

        RemoteServiceClient plain(Endpoint("plain", backend.url("/api/v1")));
        assert(GatewayKind([&] { plain.get("/teapot"); }) == GatewayError::Kind::HttpStatus);
        assert(GatewayKind([&] { plain.get("/slow"); }) == GatewayError::Kind::Timeout);

        RemoteServiceClient nowhere(Endpoint("nowhere", "http://127.0.0.1:1"));
        assert(GatewayKind([&] { nowhere.get("/"); }) == GatewayError::Kind::Unreachable);

        GatewayError transient(GatewayError::Kind::Timeout, "x", "t");
        assert(transient.isTransient());
        assert(!GatewayError(GatewayError::Kind::HttpStatus, "x", "h", 500).isTransient());
        std::cout << "[PASS] Gateway error mapping and basic auth." << std::endl;
    }

    // Size caps apply both ways; download streams past them.
    {
        RemoteServiceClient client(Endpoint("capped", backend.url("/api/v1")));
        bool oversized = false;
        try {
            client.get("/big");
        } catch (const domain::OversizedPayloadError& e) {
            oversized = e.limit() == 1024;
        }
        assert(oversized);

        bool rejected = false;
        try {
            client.put("/anything", std::make_shared<const std::string>(2048, 'x'), "application/octet-stream");
        } catch (const domain::OversizedPayloadError&) {
            rejected = true;
        }
        assert(rejected);

        std::size_t streamed = 0;
        auto delivered = client.download("/big", [&](const char*, std::size_t length) {
            streamed += length;
            return true;
        });
        assert(delivered == 4096 && streamed == 4096);
        std::cout << "[PASS] Oversized payloads rejected, downloads stream." << std::endl;
    }

    // Recognition: multipart upload, best match by similarity.
    {
        auto endpoint = Endpoint("recognition", backend.url("/api/v1"));
        RecognitionClient client(endpoint);
        domain::RecognitionRequest request;
        request.sessionId = "s1";
        request.fileName = "asm.jpg";
        request.content = std::make_shared<const std::string>("jpeg-bytes");
        request.seriesNameHint = "Amazing Spider-Man";

        auto result = client.recognizeAsync(request).get();
        assert(result.seriesName == "Amazing Spider-Man");
        assert(result.inferredYear == 1963);
        assert(result.inferredIssueCount == 441);
        assert(result.catalogId == std::string("2127"));
        assert(result.totalMatches == 2);

        auto unknown = RecognitionClient::ParseResponse(json{{"top_matches", json::array({
            {{"comic_name", "Unknown"}, {"similarity", 0.1}}})}});
        assert(!unknown.hasCandidate());
        std::cout << "[PASS] Recognition client." << std::endl;
    }

    // Large images reach the backend intact across many upload chunks.
    {
        auto endpoint = Endpoint("recognition", backend.url("/api/v1"));
        endpoint.maxBufferBytes = 1024 * 1024;
        RecognitionClient client(endpoint);

        std::string image(300000, '\0');
        for (std::size_t i = 0; i < image.size(); ++i) {
            image[i] = static_cast<char>(i % 251);
        }
        domain::RecognitionRequest request;
        request.sessionId = "s1";
        request.fileName = "big.jpg";
        request.content = std::make_shared<const std::string>(image);
        assert(client.recognize(request).seriesName == "Amazing Spider-Man");
        assert(backend.lastImage() == image);
        std::cout << "[PASS] Multipart upload streams the shared image." << std::endl;
    }

    // A call queued behind a busy worker is skipped once its token is set.
    {
        BackendExecutor executor("single", 1);
        std::promise<void> gate;
        std::shared_future<void> opened = gate.get_future().share();
        auto first = executor.submit([opened]() {
            opened.wait();
            return 1;
        });

        auto token = std::make_shared<std::atomic<bool>>(false);
        std::atomic<int> ran{0};
        auto second = executor.submit([&ran]() {
            ++ran;
            return 2;
        }, token);
        token->store(true);
        gate.set_value();

        assert(first.get() == 1);
        bool aborted = false;
        try {
            second.get();
        } catch (const domain::SessionAborted&) {
            aborted = true;
        }
        assert(aborted);
        assert(ran == 0);
        assert(executor.submit([]() { return 3; }).get() == 3);
        std::cout << "[PASS] Cancelled calls never run." << std::endl;
    }

    // Live catalog: api_key query parameter, name and year filter.
    {
        auto endpoint = Endpoint("comicvine", backend.url("/cv"));
        endpoint.auth = AuthScheme::ApiKey;
        endpoint.secret = "cv-key";
        LiveCatalogClient client(endpoint);
        auto hits = client.searchSeriesAsync("Saga", 2012).get();
        assert(hits.size() == 1);
        assert(hits[0].id == "4567" && hits[0].issueCount == 66 && hits[0].publisher == "Image");

        // Results with unusable ids or odd field types are skipped, not fatal.
        auto odd = client.searchSeries("Hellboy", 1994);
        assert(odd.size() == 1);
        assert(odd[0].id == "78" && odd[0].publisher.empty());
        assert(GatewayKind([&] { client.searchSeries("Array", 2000); }) == GatewayError::Kind::HttpStatus);

        endpoint.secret = "nope";
        LiveCatalogClient rejected(endpoint);
        assert(GatewayKind([&] { rejected.searchSeries("Saga", 2012); }) == GatewayError::Kind::Unauthorized);
        std::cout << "[PASS] Live catalog client." << std::endl;
    }

    // Inference with a bearer token.
    {
        auto endpoint = Endpoint("groq", backend.url("/openai/v1"));
        endpoint.auth = AuthScheme::Bearer;
        endpoint.secret = "groq-token";
        InferenceClient client(endpoint, "llama-test");
        auto text = client.describeSeriesAsync("Saga", 2012).get();
        assert(text && *text == "A story about llama-test");
        std::cout << "[PASS] Inference client." << std::endl;
    }

    // File store round trip with basic auth, capped fetch.
    {
        auto endpoint = Endpoint("nextcloud", backend.url("/dav"));
        endpoint.auth = AuthScheme::Basic;
        endpoint.username = "user";
        endpoint.secret = "pass";
        FileStoreClient store(endpoint);

        store.storeAsync("covers/a b.jpg", std::make_shared<const std::string>("cover"), nullptr).get();
        assert(*store.fetchAsync("covers/a b.jpg", nullptr).get() == "cover");

        store.store("covers/big.jpg", std::make_shared<const std::string>(1000, 'z'));
        auto small = endpoint;
        small.maxBufferBytes = 100;
        FileStoreClient capped(small);
        bool oversized = false;
        try {
            capped.fetch("covers/big.jpg");
        } catch (const domain::OversizedPayloadError&) {
            oversized = true;
        }
        assert(oversized);
        assert(GatewayKind([&] { store.fetch("covers/missing.jpg"); }) == GatewayError::Kind::HttpStatus);
        std::cout << "[PASS] File store client." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
