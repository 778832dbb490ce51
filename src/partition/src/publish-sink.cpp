#include "rangepart/partition/publish-sink.h"
#include "rangepart/partition/wire-format.h"

#include <algorithm>

namespace rangepart::partition {

LogPartition&
PublishSink::get_log_partition()
{
    static LogPartition partition("publish");
    return partition;
}

void
PublishSink::State::complete(
    std::uint64_t sequence_number,
    broker::DeliveryReport const& report)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (abandoned || pending.erase(sequence_number) == 0)
            return;
        if (!report.ok)
        {
            failures.push_back({sequence_number, report.error});
        }
    }
    settled.notify_all();
}

PublishSink::PublishSink(
    broker::BrokerClient& client,
    std::string topic,
    std::chrono::milliseconds settle_timeout)
    : client_(client)
    , topic_(std::move(topic))
    , settle_timeout_(settle_timeout)
    , state_(std::make_shared<State>())
{
}

void
PublishSink::publish(const PartitionDescriptor& descriptor)
{
    const auto sequence = descriptor.sequence_number;
    const auto key = message_key(sequence);
    ++submitted_;

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->pending.insert(sequence);
    }

    try
    {
        auto payload = encode_partition(descriptor);
        client_.send(
            topic_,
            key,
            payload,
            [state = state_,
             sequence,
             start = descriptor.start_byte,
             end = descriptor.end_byte](broker::DeliveryReport const& report) {
                if (report.ok)
                {
                    LOGD("Sent partition ", sequence, ": bytes ", start, "-", end);
                }
                else
                {
                    LOGE(
                        "Failed to send partition ",
                        sequence,
                        ": bytes ",
                        start,
                        "-",
                        end,
                        ": ",
                        report.error);
                }
                state->complete(sequence, report);
            });
    }
    catch (const std::exception& e)
    {
        OLOGE(
            "Failed to send partition ",
            sequence,
            " immediately: ",
            e.what());
        state_->complete(sequence, broker::DeliveryReport{false, e.what()});
    }
}

std::uint32_t
PublishSink::await_and_count_failures()
{
    std::unique_lock<std::mutex> lock(state_->mutex);
    bool settled = state_->settled.wait_for(
        lock, settle_timeout_, [this] { return state_->pending.empty(); });

    if (!settled)
    {
        OLOGE(
            state_->pending.size(),
            " publishes still unacknowledged after ",
            settle_timeout_.count(),
            " ms, counting them as failed");
        // Late acknowledgements are ignored from here on
        state_->abandoned = true;
        for (auto sequence : state_->pending)
        {
            state_->failures.push_back(
                {sequence, "unacknowledged at settle timeout"});
        }
        state_->pending.clear();
    }

    return static_cast<std::uint32_t>(state_->failures.size());
}

std::vector<PublishFailure>
PublishSink::failures() const
{
    std::vector<PublishFailure> out;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        out = state_->failures;
    }
    std::sort(out.begin(), out.end(), [](auto const& a, auto const& b) {
        return a.sequence_number < b.sequence_number;
    });
    return out;
}

}  // namespace rangepart::partition
