// HTTP-backed prober

#include "prober.h"
#include <algorithm>
#include <cctype>

std::string ProbeResult::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (h.first.size() != name.size()) continue;
        bool same = std::equal(h.first.begin(), h.first.end(), name.begin(),
            [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
        if (same) return h.second;
    }
    return "";
}

HttpProber::HttpProber(const HttpClient& client, logging::Sink& sink)
    : client_(client), sink_(sink) {}

bool HttpProber::probe(const std::string& url, ProbeResult& out) const {
    sink_.log(logging::Level::INFO, "probe_issued", {{"url", url}});

    HttpRequest req;
    req.method = "GET";
    req.url = url;

    HttpResponse resp;
    bool ok = client_.perform(req, resp);

    out.url = url;
    if (!ok) {
        out.error = resp.error.empty() ? "request failed" : resp.error;
        sink_.log(logging::Level::WARNING, "probe_failed", {{"url", url}, {"error", out.error}});
        return false;
    }

    out.final_url = resp.effective_url.empty() ? url : resp.effective_url;
    out.status = resp.status;
    out.headers = std::move(resp.headers);
    out.cookies = std::move(resp.cookies);
    out.body = std::move(resp.body);
    out.error.clear();

    sink_.log(logging::Level::INFO, "probe_response", {
        {"url", url},
        {"status", out.status},
        {"final_url", out.final_url},
        {"elapsed", resp.total_time}
    });

    nlohmann::json header_names = nlohmann::json::array();
    for (const auto& h : out.headers) header_names.push_back(h.first);
    sink_.log(logging::Level::DEBUG, "probe_details", {
        {"url", url},
        {"headers", header_names},
        {"cookies", out.cookies.size()},
        {"body_bytes", out.body.size()}
    });
    return true;
}
