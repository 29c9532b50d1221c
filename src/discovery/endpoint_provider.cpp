// beacon/src/discovery/endpoint_provider.cpp
#include "beacon/discovery/endpoint_provider.hpp"

#include <boost/asio/post.hpp>
#include <fstream>
#include <stdexcept>

#include "beacon/log/logger.hpp"
#include "nlohmann/json.hpp"

namespace beacon::discovery {

namespace {

constexpr const char* FILE_SCHEME = "file://";

std::string strip_file_scheme(const std::string& location) {
    const std::string scheme = FILE_SCHEME;
    if (location.compare(0, scheme.size(), scheme) == 0) {
        return location.substr(scheme.size());
    }
    return location;
}

}  // namespace

InMemoryEndpointProvider::InMemoryEndpointProvider(
    boost::asio::io_context& io_context)
    : _io_context(io_context) {}

void InMemoryEndpointProvider::set_inventory(std::vector<VmRecord> records) {
    std::lock_guard<std::mutex> lock(_mutex);
    _records = std::move(records);
}

void InMemoryEndpointProvider::set_failure(
    std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(_mutex);
    _failure = std::move(message);
}

std::size_t InMemoryEndpointProvider::fetch_count() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _fetch_count;
}

void InMemoryEndpointProvider::fetch(const SelectionFilter& filter,
                                     FetchHandler handler) {
    std::optional<ProviderError> error;
    std::vector<Endpoint> endpoints;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_fetch_count;
        if (_failure) {
            error = ProviderError::now(*_failure);
        } else {
            endpoints = select_endpoints(_records, filter);
        }
    }

    boost::asio::post(_io_context, [handler = std::move(handler),
                                    error = std::move(error),
                                    endpoints = std::move(endpoints)]() mutable {
        handler(std::move(error), std::move(endpoints));
    });
}

FileInventoryProvider::FileInventoryProvider(
    boost::asio::io_context& io_context, const std::string& location)
    : _io_context(io_context), _path(strip_file_scheme(location)) {
    if (_path.empty()) {
        throw std::invalid_argument("inventory file path must not be empty");
    }
}

std::vector<VmRecord> FileInventoryProvider::load() const {
    std::ifstream ifs(_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open inventory file " + _path);
    }

    try {
        nlohmann::json j = nlohmann::json::parse(ifs);
        if (!j.is_array()) {
            throw std::runtime_error("inventory file " + _path +
                                     " must contain a JSON array");
        }
        return j.get<std::vector<VmRecord>>();
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("JSON parse error in inventory file " +
                                 _path + ": " + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("malformed inventory file " + _path + ": " +
                                 e.what());
    }
}

void FileInventoryProvider::fetch(const SelectionFilter& filter,
                                  FetchHandler handler) {
    std::optional<ProviderError> error;
    std::vector<Endpoint> endpoints;
    try {
        endpoints = select_endpoints(load(), filter);
    } catch (const std::runtime_error& e) {
        error = ProviderError::now(e.what());
    }

    boost::asio::post(_io_context, [handler = std::move(handler),
                                    error = std::move(error),
                                    endpoints = std::move(endpoints)]() mutable {
        handler(std::move(error), std::move(endpoints));
    });
}

std::shared_ptr<IEndpointProvider> make_endpoint_provider(
    boost::asio::io_context& io_context, const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end != std::string::npos &&
        url.compare(0, scheme_end + 3, FILE_SCHEME) != 0) {
        throw std::invalid_argument("unsupported inventory url: " + url);
    }
    BEACON_LOG_DEBUG << "Using file inventory provider for " << url;
    return std::make_shared<FileInventoryProvider>(io_context, url);
}

}  // namespace beacon::discovery
