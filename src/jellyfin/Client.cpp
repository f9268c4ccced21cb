#include "jellyfin/Client.hpp"
#include "jellyfin/model/Config.hpp"
#include "runtime/errors.hpp"
#include "util/curl.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

using namespace sm::jellyfin;
using namespace sm::jellyfin::model;
using namespace sm::runtime;
using namespace sm::util;
using namespace sm::log;

namespace {

std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    return s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
}

HttpResponse request(const std::string& method, const std::string& url, const std::string& apiKey,
                     const unsigned int timeoutSeconds) {
    HeaderList headers;
    headers.add("X-Emby-Token: " + apiKey);
    headers.add("Accept: application/json");

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.list);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds));
        if (method == "POST") {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, 0L);
        }
    });
}

}

Client::Client(std::string serverUrl, std::string apiKey, const unsigned int timeoutSeconds)
    : serverUrl_(normalizeUrl(serverUrl)), apiKey_(std::move(apiKey)), timeoutSeconds_(timeoutSeconds) {}

std::vector<ScheduledTask> Client::listTasks(const bool includeHidden) {
    const auto url = serverUrl_ + "/ScheduledTasks";
    const auto res = request("GET", url, apiKey_, timeoutSeconds_);

    if (res.curl != CURLE_OK) throw ConnectionFailure(fmt::format("GET {} failed: {}", url, res.error));
    if (!res.ok()) throw ConnectionFailure(fmt::format("GET {} returned HTTP {}: {}", url, res.http, trimmed(res.body)));

    std::vector<ScheduledTask> tasks;
    try {
        const auto body = nlohmann::json::parse(res.body);
        if (!body.is_array()) throw ConnectionFailure("Unexpected /ScheduledTasks payload (not an array)");
        for (const auto& raw : body) {
            auto task = raw.get<ScheduledTask>();
            if (task.id.empty()) continue;
            if (task.is_hidden && !includeHidden) continue;
            tasks.push_back(std::move(task));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConnectionFailure(fmt::format("Invalid /ScheduledTasks payload: {}", e.what()));
    }

    Registry::remote()->debug("[JellyfinClient] {} task(s) listed", tasks.size());
    return tasks;
}

void Client::triggerTask(const ScheduledTask& task) {
    const auto url = serverUrl_ + "/ScheduledTasks/Running/" + task.id;
    const auto res = request("POST", url, apiKey_, timeoutSeconds_);

    if (res.curl != CURLE_OK)
        throw TaskFailure(task.name, fmt::format("Failed to start '{}': {}", task.name, res.error));
    if (res.http != 204)
        throw TaskFailure(task.name, fmt::format("Failed to start '{}': {} {}", task.name, res.http, trimmed(res.body)));
}

TaskStatus Client::pollTask(const std::string& taskId) {
    const auto url = serverUrl_ + "/ScheduledTasks/" + taskId;
    const auto res = request("GET", url, apiKey_, timeoutSeconds_);

    if (res.curl != CURLE_OK) throw ConnectionFailure(fmt::format("GET {} failed: {}", url, res.error));
    if (res.http == 404) return TaskStatus::completed();
    if (!res.ok()) throw ConnectionFailure(fmt::format("GET {} returned HTTP {}", url, res.http));

    try {
        return nlohmann::json::parse(res.body).get<TaskStatus>();
    } catch (const nlohmann::json::exception& e) {
        throw ConnectionFailure(fmt::format("Invalid task status payload: {}", e.what()));
    }
}

void Client::testConnection() {
    const auto tasks = listTasks(true);
    Registry::jellyfin()->info("[JellyfinClient] Connection to {} OK ({} tasks)", serverUrl_, tasks.size());
}
