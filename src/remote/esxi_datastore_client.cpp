#include "remote/esxi_datastore_client.hpp"

#include "io/memory_reader.hpp"
#include "util/logger.hpp"

#include <cctype>
#include <cstdio>

namespace ovaup {

namespace {
constexpr const char* kDatacenter = "ha-datacenter";
} // namespace

std::string NormalizeHostUrl(const std::string& host) {
    std::string url = host;
    if (url.find("://") == std::string::npos) url = "https://" + url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    // Accept the SDK endpoint form some tools print.
    const std::string sdk = "/sdk";
    if (url.size() > sdk.size() && url.compare(url.size() - sdk.size(), sdk.size(), sdk) == 0) {
        url.resize(url.size() - sdk.size());
    }
    return url;
}

std::string EncodeUrlPath(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

EsxiDatastoreClient::EsxiDatastoreClient(EsxiConfig cfg, IHttpClient& http)
    : cfg_(std::move(cfg)), http_(http), base_url_(NormalizeHostUrl(cfg_.host)) {}

Credentials EsxiDatastoreClient::GetCredentials() const {
    return Credentials{cfg_.username, cfg_.password, cfg_.insecure};
}

Result EsxiDatastoreClient::Probe(const std::string& url, const char* what) {
    HttpRequest req;
    req.url = url;
    req.username = cfg_.username;
    req.password = cfg_.password;
    req.insecure = cfg_.insecure;
    req.timeout = std::chrono::seconds{60};

    HttpResponse resp;
    auto r = http_.Get(req, resp);
    if (!r.ok) return r;

    if (resp.status == 401 || resp.status == 403) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            std::string(what) + ": authentication rejected (status " +
                                std::to_string(resp.status) + ")");
    }
    if (resp.status == 404) {
        return Result::Fail(ErrorCode::NotFound, std::string(what) + ": not found");
    }
    if (resp.status < 200 || resp.status >= 300) {
        return Result::Fail(ErrorCode::Network,
                            std::string(what) + ": unexpected status " +
                                std::to_string(resp.status));
    }
    return Result::Ok();
}

Result EsxiDatastoreClient::Connect() {
    auto r = Probe(base_url_ + "/folder", "failed to connect to ESXi");
    if (!r.ok) return r;
    connected_ = true;
    LogInfo("Connected to %s", base_url_.c_str());
    return Result::Ok();
}

Result EsxiDatastoreClient::LookupDestination(const std::string& name, DestinationHandle& out) {
    if (!connected_) {
        return Result::Fail(ErrorCode::InvalidArgument, "not connected to ESXi");
    }
    if (name.empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "datastore name is empty");
    }

    const std::string url = base_url_ + "/folder?dcPath=" + kDatacenter + "&dsName=" +
                            EncodeUrlPath(name);
    auto r = Probe(url, ("failed to find datastore " + name).c_str());
    if (!r.ok) return r;

    out.name = name;
    out.base_url = base_url_;
    return Result::Ok();
}

std::string EsxiDatastoreClient::BuildUploadUrl(const DestinationHandle& dest,
                                                const std::string& remote_path) const {
    return dest.base_url + "/folder/" + EncodeUrlPath(remote_path) + "?dcPath=" + kDatacenter +
           "&dsName=" + EncodeUrlPath(dest.name);
}

Result EsxiDatastoreClient::CreateItemFromDescriptor(const std::string& descriptor,
                                                     const std::string& name,
                                                     const DestinationHandle& dest,
                                                     const std::string& network) {
    if (!connected_) {
        return Result::Fail(ErrorCode::InvalidArgument, "not connected to ESXi");
    }

    const std::string remote_path = name + "/" + name + ".ovf";
    HttpRequest req;
    req.url = BuildUploadUrl(dest, remote_path);
    req.username = cfg_.username;
    req.password = cfg_.password;
    req.insecure = cfg_.insecure;

    MemoryReader body(descriptor);
    HttpResponse resp;
    auto r = http_.Put(req, body, descriptor.size(), resp);
    if (!r.ok) return r;
    if (!IsUploadSuccessStatus(resp.status)) {
        return Result::Fail(ErrorCode::Network,
                            "descriptor upload failed with status " +
                                std::to_string(resp.status) + ": " + resp.body);
    }

    if (!network.empty()) {
        LogWarn("Network '%s' is not attached by a datastore upload; select it when %s is registered",
                network.c_str(), name.c_str());
    }
    LogInfo("Descriptor for %s placed at [%s] %s", name.c_str(), dest.name.c_str(),
            remote_path.c_str());
    return Result::Ok();
}

} // namespace ovaup
