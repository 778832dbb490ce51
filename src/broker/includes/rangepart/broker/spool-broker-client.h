#pragma once

#include "rangepart/broker/broker-client.h"
#include "rangepart/core/logger.h"

#include <boost/asio/thread_pool.hpp>
#include <boost/filesystem.hpp>

#include <fstream>
#include <mutex>

namespace rangepart::broker {

/**
 * Broker client that appends messages to a local spool file.
 *
 * Each message becomes one line, `<topic>\t<key>\t<payload>\n`, written and
 * flushed on a background thread; the delivery report reflects whether the
 * flush succeeded. Useful for dry runs and for handing partitions to a
 * separate shipper process.
 */
class SpoolBrokerClient : public BrokerClient
{
public:
    /**
     * @throws BrokerError if the spool file cannot be opened for append
     */
    explicit SpoolBrokerClient(boost::filesystem::path path);
    ~SpoolBrokerClient() override;

    SpoolBrokerClient(const SpoolBrokerClient&) = delete;
    SpoolBrokerClient&
    operator=(const SpoolBrokerClient&) = delete;

    void
    send(
        const std::string& topic,
        const std::string& key,
        const std::string& payload,
        DeliveryCallback on_delivery) override;

    // Finish pending writes; later sends are rejected
    void
    close();

    const boost::filesystem::path&
    path() const
    {
        return path_;
    }

    static LogPartition&
    get_log_partition();

private:
    void
    write_line(
        const std::string& topic,
        const std::string& key,
        const std::string& payload,
        DeliveryCallback const& on_delivery);

    boost::filesystem::path path_;
    std::ofstream out_;
    std::mutex write_mutex_;
    // Guards closed_ and every post to pool_
    std::mutex state_mutex_;
    bool closed_ = false;
    boost::asio::thread_pool pool_{1};
};

}  // namespace rangepart::broker
