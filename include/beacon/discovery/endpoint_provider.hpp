// beacon/include/beacon/discovery/endpoint_provider.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "beacon/discovery/backend.hpp"
#include "beacon/discovery/inventory.hpp"

namespace beacon::discovery {

/// @brief Completion of a fetch: either an error, or the matching endpoints.
using FetchHandler = std::function<void(std::optional<ProviderError> error,
                                        std::vector<Endpoint> endpoints)>;

/// @brief Defines the contract for any inventory a resolver can poll.
/// Transport, retries and backoff are the provider's business; the resolver
/// only needs "the endpoints matching this filter, or an error".
class IEndpointProvider {
public:
    virtual ~IEndpointProvider() = default;

    /// @brief Starts a query. `handler` is invoked exactly once, either
    /// before fetch() returns or later on the provider's io_context.
    virtual void fetch(const SelectionFilter& filter, FetchHandler handler) = 0;

    /// @brief Short description for logs.
    virtual std::string describe() const = 0;
};

/// @brief An in-process inventory. Useful for tests and demos.
/// Completions are posted to the io_context, never run inline.
class InMemoryEndpointProvider : public IEndpointProvider {
public:
    explicit InMemoryEndpointProvider(boost::asio::io_context& io_context);

    // Thread-safe
    void set_inventory(std::vector<VmRecord> records);
    // A set failure is reported by every fetch until cleared.
    void set_failure(std::optional<std::string> message);
    std::size_t fetch_count() const;

    void fetch(const SelectionFilter& filter, FetchHandler handler) override;
    std::string describe() const override { return "in-memory inventory"; }

private:
    boost::asio::io_context& _io_context;
    mutable std::mutex _mutex;
    std::vector<VmRecord> _records;
    std::optional<std::string> _failure;
    std::size_t _fetch_count = 0;
};

/// @brief Reads a JSON inventory file (an array of machines) on every fetch.
/// `location` is either a plain path or a file:// URL.
class FileInventoryProvider : public IEndpointProvider {
public:
    FileInventoryProvider(boost::asio::io_context& io_context,
                          const std::string& location);

    void fetch(const SelectionFilter& filter, FetchHandler handler) override;
    std::string describe() const override { return "file " + _path; }

    const std::string& path() const { return _path; }

    /// @brief Loads and parses the inventory.
    /// @throws std::runtime_error if the file cannot be read or parsed.
    std::vector<VmRecord> load() const;

private:
    boost::asio::io_context& _io_context;
    std::string _path;
};

/// @brief Factory function picking a provider for a resolver url.
/// @throws std::invalid_argument for unsupported schemes.
std::shared_ptr<IEndpointProvider> make_endpoint_provider(
    boost::asio::io_context& io_context, const std::string& url);

}  // namespace beacon::discovery
