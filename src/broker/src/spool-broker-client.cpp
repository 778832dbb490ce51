#include "rangepart/broker/spool-broker-client.h"
#include "rangepart/core/errors.h"

#include <boost/asio/post.hpp>

namespace rangepart::broker {

LogPartition&
SpoolBrokerClient::get_log_partition()
{
    static LogPartition partition("broker");
    return partition;
}

SpoolBrokerClient::SpoolBrokerClient(boost::filesystem::path path)
    : path_(std::move(path))
{
    if (path_.has_parent_path())
    {
        boost::system::error_code ec;
        boost::filesystem::create_directories(path_.parent_path(), ec);
    }
    out_.open(path_.string(), std::ios::out | std::ios::app | std::ios::binary);
    if (!out_.is_open())
    {
        throw BrokerError("Cannot open spool file: " + path_.string());
    }
    OLOGI("Spooling partition messages to ", path_.string());
}

SpoolBrokerClient::~SpoolBrokerClient()
{
    close();
}

void
SpoolBrokerClient::close()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_)
            return;
        closed_ = true;
    }
    pool_.join();
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_.close();
}

void
SpoolBrokerClient::send(
    const std::string& topic,
    const std::string& key,
    const std::string& payload,
    DeliveryCallback on_delivery)
{
    if (topic.find_first_of("\t\n") != std::string::npos ||
        key.find_first_of("\t\n") != std::string::npos ||
        payload.find('\n') != std::string::npos)
    {
        throw BrokerError("Message for key " + key + " cannot be spooled");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (closed_)
    {
        throw BrokerError("Spool client is closed");
    }
    boost::asio::post(
        pool_,
        [this, topic, key, payload, cb = std::move(on_delivery)]() {
            write_line(topic, key, payload, cb);
        });
}

void
SpoolBrokerClient::write_line(
    const std::string& topic,
    const std::string& key,
    const std::string& payload,
    DeliveryCallback const& on_delivery)
{
    DeliveryReport report;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        out_ << topic << '\t' << key << '\t' << payload << '\n';
        out_.flush();
        report.ok = out_.good();
        if (!report.ok)
        {
            report.error = "write to " + path_.string() + " failed";
            out_.clear();
        }
    }

    if (!report.ok)
    {
        OLOGE("Spool write failed for ", key, ": ", report.error);
    }

    try
    {
        on_delivery(report);
    }
    catch (const std::exception& e)
    {
        OLOGE("Delivery callback for ", key, " threw: ", e.what());
    }
}

}  // namespace rangepart::broker
